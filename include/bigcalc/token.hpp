#pragma once
#include <string>
#include <utility>
#include <variant>

#include <gmpxx.h>

namespace bigcalc {

enum class Op {
    LeftParen,
    Add, Subtract,
    Multiply, Divide,
    Power,
    RightParen,
};

// Either a literal or a variable reference, never both.
struct Operand {
    bool is_name{false};
    std::string name{}; // identifier, when is_name
    mpz_class value{};  // literal, otherwise

    static Operand literal(mpz_class v) { return Operand{false, {}, std::move(v)}; }
    static Operand identifier(std::string n) { return Operand{true, std::move(n), {}}; }
};

using Token = std::variant<Operand, Op>;

/// Binding strength of a binary operator; higher binds tighter.
/// Parentheses have tier 0 and never take part in precedence comparisons.
int tier(Op op);

bool is_paren(Op op);

/// Apply a binary operator to (a, b). Throws EvalError on division by zero,
/// on an exponent that is negative or too large, or when given a parenthesis.
mpz_class apply(Op op, const mpz_class& a, const mpz_class& b);

std::string to_string(Op op);
std::string to_string(const Operand& operand);
std::string to_string(const Token& token);

} // namespace bigcalc
