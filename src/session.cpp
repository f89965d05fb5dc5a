#include "bigcalc/session.hpp"
#include "bigcalc/error.hpp"
#include "bigcalc/lexer.hpp"
#include "bigcalc/parser.hpp"

#include <cctype>

namespace bigcalc {

// word characters, optional whitespace, then '='
static bool looks_like_assignment(std::string_view line) {
    std::size_t i = 0;
    while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '_')) ++i;
    if (i == 0) return false;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    return i < line.size() && line[i] == '=';
}

LineKind classify(std::string_view line) {
    if (line == "/help") return LineKind::Help;
    if (line == "/exit") return LineKind::Exit;
    if (looks_like_assignment(line)) return LineKind::Assignment;
    if (is_integer_literal(line)) return LineKind::SingleNumber;
    if (trim(line).empty()) return LineKind::Empty;
    if (line.front() != '/') return LineKind::Expression;
    return LineKind::UnknownCommand;
}

const char* Session::help_text() {
    return "The program evaluates integer expressions of any size.\n"
           "Operators: + - * / ^ and parentheses; / truncates toward zero.\n"
           "An even run of minus signs adds, an odd run subtracts: 5 -- 3 is 8.\n"
           "Assign with 'name = value', where value is a number or a known name.\n"
           "Names are made of latin letters only and are case-sensitive.\n"
           "Commands: /help, /exit";
}

mpz_class Session::evaluate(std::string_view expression) const {
    Program p = compile(expression, trace_);
    return p.evaluate(env_);
}

Reply Session::handle(std::string_view raw) {
    std::string_view line = trim(raw);

    try {
        switch (classify(line)) {
            case LineKind::Help:
                return {help_text()};
            case LineKind::Exit:
                return {"Bye!", true};
            case LineKind::Assignment:
                execute_assignment(line, env_);
                return {};
            case LineKind::SingleNumber:
                return {resolve_operand(line, env_).get_str()};
            case LineKind::Empty:
                return {};
            case LineKind::Expression:
                return {evaluate(line).get_str()};
            case LineKind::UnknownCommand:
                return {"Unknown command"};
        }
    } catch (const Error& e) {
        trace_("{}: {}", to_string(e.kind()), e.detail());
        return {e.what()};
    }
    return {"Invalid expression"};
}

} // namespace bigcalc
