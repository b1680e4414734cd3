#include <csskit/css/parser/parse_error.h>
#include <sstream>

namespace csskit::css {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LexError:              return "lex-error";
        case ErrorKind::UnexpectedToken:       return "unexpected-token";
        case ErrorKind::UnterminatedConstruct: return "unterminated-construct";
        case ErrorKind::InvalidArity:          return "invalid-arity";
        case ErrorKind::NumberFormat:          return "number-format";
        case ErrorKind::NestingDepthExceeded:  return "nesting-depth-exceeded";
    }
    return "unknown";
}

std::string ParseError::format() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << " at " << span.begin << ".." << span.end
        << ": " << message;
    return oss.str();
}

ParseException::ParseException(ParseError error)
    : std::runtime_error(error.format()), error_(std::move(error)) {}

} // namespace csskit::css
