#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "bigcalc/token.hpp"

namespace bigcalc {

/// Variables of one session. Entries are created by assignment and never
/// removed.
class Environment {
public:
    /// nullptr when the name is not bound.
    const mpz_class* find(std::string_view name) const;

    /// Throws EvalError(UnknownIdentifier) when the name is not bound.
    const mpz_class& at(std::string_view name) const;

    bool contains(std::string_view name) const { return find(name) != nullptr; }
    std::size_t size() const { return vars_.size(); }

    void assign(std::string name, mpz_class value);

private:
    std::map<std::string, mpz_class, std::less<>> vars_;
};

/// Value of a lexed operand: the literal itself or the bound variable.
mpz_class resolve(const Operand& operand, const Environment& env);

/// Value of a bare operand string: a signed integer literal or a bound
/// identifier. Anything else is an invalid identifier.
mpz_class resolve_operand(std::string_view text, const Environment& env);

/// Execute "name = operand". The environment is only touched on success.
/// Throws EvalError(InvalidIdentifier) for a bad left- or right-hand side and
/// EvalError(UnknownIdentifier) when the right-hand side is an unbound name.
void execute_assignment(std::string_view line, Environment& env);

} // namespace bigcalc
