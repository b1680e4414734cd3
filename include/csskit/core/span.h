#pragma once
#include <cstddef>

namespace csskit::core {

// Half-open byte range [begin, end) into the source buffer handed to the
// parser. Nested parses report offsets into the original buffer, never into
// the block substring they were given.
struct Span {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return end <= begin; }

    bool operator==(const Span& other) const {
        return begin == other.begin && end == other.end;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

} // namespace csskit::core
