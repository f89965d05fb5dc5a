#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace bigcalc {

enum class ErrorKind {
    LexFailure,
    UnbalancedParentheses,
    StackUnderflow,
    UnknownIdentifier,
    InvalidIdentifier,
    ArithmeticFault,
};

// what() is the message shown to the user; detail() says where it went wrong.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::string detail = {})
        : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

/// Lexing and infix-to-postfix conversion failures.
struct ParseError : Error { using Error::Error; };

/// Evaluation and assignment failures.
struct EvalError : Error { using Error::Error; };

const char* to_string(ErrorKind kind);

} // namespace bigcalc
