#include "bigcalc/error.hpp"

namespace bigcalc {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LexFailure:            return "LexFailure";
        case ErrorKind::UnbalancedParentheses: return "UnbalancedParentheses";
        case ErrorKind::StackUnderflow:        return "StackUnderflow";
        case ErrorKind::UnknownIdentifier:     return "UnknownIdentifier";
        case ErrorKind::InvalidIdentifier:     return "InvalidIdentifier";
        case ErrorKind::ArithmeticFault:       return "ArithmeticFault";
    }
    return "Unknown";
}

} // namespace bigcalc
