#pragma once
#include <csskit/core/span.h>
#include <stdexcept>
#include <string>

namespace csskit::css {

using core::Span;

enum class ErrorKind {
    LexError,               // unrecognised or malformed byte sequence
    UnexpectedToken,        // missing ':' ';' '{' or a token invalid here
    UnterminatedConstruct,  // input ended inside a function or at-rule
    InvalidArity,           // wrong argument count for rgb()/rgba()/rect()
    NumberFormat,           // numeric text that does not fit its slot
    NestingDepthExceeded    // blocks nested deeper than ParserOptions allows
};

const char* error_kind_name(ErrorKind kind);

struct ParseError {
    ErrorKind kind = ErrorKind::UnexpectedToken;
    std::string message;
    Span span;

    // "unexpected-token at 13..17: expected ':' after property 'color'"
    std::string format() const;
};

// Raised inside the parser and caught at the public entry points, which hand
// the carried ParseError back to the caller.
class ParseException : public std::runtime_error {
public:
    explicit ParseException(ParseError error);

    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

} // namespace csskit::css
