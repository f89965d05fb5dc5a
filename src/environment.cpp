#include "bigcalc/environment.hpp"
#include "bigcalc/error.hpp"
#include "bigcalc/lexer.hpp"

namespace bigcalc {

const mpz_class* Environment::find(std::string_view name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

const mpz_class& Environment::at(std::string_view name) const {
    const mpz_class* v = find(name);
    if (!v) throw EvalError(ErrorKind::UnknownIdentifier, "Unknown variable", "'" + std::string(name) + "' is not defined");
    return *v;
}

void Environment::assign(std::string name, mpz_class value) {
    vars_.insert_or_assign(std::move(name), std::move(value));
}

mpz_class resolve(const Operand& operand, const Environment& env) {
    if (operand.is_name) return env.at(operand.name);
    return operand.value;
}

mpz_class resolve_operand(std::string_view text, const Environment& env) {
    text = trim(text);
    if (is_integer_literal(text)) return parse_integer(text);
    if (is_identifier(text)) return env.at(text);
    throw EvalError(ErrorKind::InvalidIdentifier, "Invalid identifier", "'" + std::string(text) + "' is neither a number nor a name");
}

void execute_assignment(std::string_view line, Environment& env) {
    auto eq = line.find('=');
    if (eq == std::string_view::npos) throw EvalError(ErrorKind::InvalidIdentifier, "Invalid identifier", "missing '='");

    std::string_view lhs = trim(line.substr(0, eq));
    std::string_view rhs = trim(line.substr(eq + 1));

    if (!is_identifier(lhs)) throw EvalError(ErrorKind::InvalidIdentifier, "Invalid identifier", "'" + std::string(lhs) + "' cannot be assigned");

    mpz_class v = resolve_operand(rhs, env);
    env.assign(std::string(lhs), std::move(v));
}

} // namespace bigcalc
