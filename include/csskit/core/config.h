#ifndef CSSKIT_CORE_CONFIG_H
#define CSSKIT_CORE_CONFIG_H

#include <cstddef>

namespace csskit::core::config {

// Deepest chain of block re-parses (rule inside rule inside at-rule ...)
// accepted before the parser reports NestingDepthExceeded.
inline constexpr std::size_t kDefaultMaxNestingDepth = 32;

// Deepest chain of function calls inside one value, e.g. f(g(h(1))).
inline constexpr std::size_t kDefaultMaxFunctionDepth = 32;

// Semicolon-terminated at-rules (@import, @charset) are rejected unless
// enabled per parse.
inline constexpr bool kDefaultAllowBlocklessAtRules = false;

inline constexpr const char kDiagnosticsModule[] = "css";

}  // namespace csskit::core::config

#endif  // CSSKIT_CORE_CONFIG_H
