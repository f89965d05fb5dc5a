#pragma once
#include <optional>
#include <string_view>
#include <vector>

#include "bigcalc/error.hpp"
#include "bigcalc/token.hpp"

namespace bigcalc {

/// Splits one input line into tokens, front to back.
///
/// Each call to next() trims leading whitespace and tries the rule table in a
/// fixed order: parentheses, the `+` run, even and odd `-` runs, `*`, `/`, `^`,
/// then integer literals and identifiers. The first rule that matches at the
/// current position wins and its text is consumed.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Next token, or nullopt once the input is exhausted.
    /// Throws ParseError(LexFailure) when no rule matches.
    std::optional<Token> next();

    /// Unconsumed input, without leading whitespace.
    std::string_view remainder();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    std::size_t i_{0};
};

/// Lex a whole line. Throws ParseError on the first unmatched fragment.
std::vector<Token> tokenize(std::string_view input);

// Whole-string helpers shared with assignment and line handling.
std::string_view trim(std::string_view s);
bool is_identifier(std::string_view s);
bool is_integer_literal(std::string_view s);

/// Parse an optionally signed run of decimal digits.
mpz_class parse_integer(std::string_view s);

} // namespace bigcalc
