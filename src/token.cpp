#include "bigcalc/token.hpp"
#include "bigcalc/error.hpp"

namespace bigcalc {

int tier(Op op) {
    switch (op) {
        case Op::Power:    return 3;
        case Op::Multiply:
        case Op::Divide:   return 2;
        case Op::Add:
        case Op::Subtract: return 1;
        default:           return 0;
    }
}

bool is_paren(Op op) { return op == Op::LeftParen || op == Op::RightParen; }

// Largest power result computed, in bits (128 MiB).
static constexpr unsigned long kMaxPowerBits = 1UL << 30;

static mpz_class power(const mpz_class& base, const mpz_class& exponent) {
    if (sgn(exponent) < 0)
        throw EvalError(ErrorKind::ArithmeticFault, "Invalid exponent", "negative exponent " + exponent.get_str());
    if (!exponent.fits_ulong_p())
        throw EvalError(ErrorKind::ArithmeticFault, "Invalid exponent", "exponent too large: " + exponent.get_str());

    unsigned long e = exponent.get_ui();
    // 0, 1 and -1 never grow. Anything larger needs about bits * e bits.
    if (mpz_cmpabs_ui(base.get_mpz_t(), 1) > 0) {
        unsigned long bits = mpz_sizeinbase(base.get_mpz_t(), 2);
        if (e > kMaxPowerBits / bits)
            throw EvalError(ErrorKind::ArithmeticFault, "Invalid exponent",
                            "result of " + base.get_str() + " ^ " + exponent.get_str() + " exceeds "
                            + std::to_string(kMaxPowerBits) + " bits");
    }

    mpz_class r;
    mpz_pow_ui(r.get_mpz_t(), base.get_mpz_t(), e);
    return r;
}

mpz_class apply(Op op, const mpz_class& a, const mpz_class& b) {
    switch (op) {
        case Op::Add:      return a + b;
        case Op::Subtract: return a - b;
        case Op::Multiply: return a * b;
        case Op::Divide:
            if (sgn(b) == 0) throw EvalError(ErrorKind::ArithmeticFault, "Division by zero", a.get_str() + " / 0");
            return a / b; // truncates toward zero
        case Op::Power:    return power(a, b);
        default: break;
    }
    throw EvalError(ErrorKind::StackUnderflow, "Invalid expression", "parenthesis in postfix sequence");
}

std::string to_string(Op op) {
    switch (op) {
        case Op::LeftParen:  return "(";
        case Op::Add:        return "+";
        case Op::Subtract:   return "-";
        case Op::Multiply:   return "*";
        case Op::Divide:     return "/";
        case Op::Power:      return "^";
        case Op::RightParen: return ")";
    }
    return "?";
}

std::string to_string(const Operand& operand) {
    return operand.is_name ? operand.name : operand.value.get_str();
}

std::string to_string(const Token& token) {
    if (const auto* op = std::get_if<Op>(&token)) return to_string(*op);
    return to_string(std::get<Operand>(token));
}

} // namespace bigcalc
