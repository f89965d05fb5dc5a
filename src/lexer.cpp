#include "bigcalc/lexer.hpp"
#include <cctype>
#include <string>

namespace bigcalc {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}
static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool word_at(std::string_view s, std::size_t i) {
    return i < s.size() && is_word_char(s[i]);
}

static bool word_boundary(std::string_view s, std::size_t i) {
    bool before = i > 0 && word_at(s, i - 1);
    return before != word_at(s, i);
}

// A token ending at `end` must be followed, after optional whitespace, by a
// word boundary, a parenthesis, or the end of the line.
static bool delimited(std::string_view s, std::size_t end) {
    for (std::size_t q = end;; ++q) {
        if (q >= s.size() || s[q] == '(' || s[q] == ')' || word_boundary(s, q)) return true;
        if (!is_space(s[q])) return false;
    }
}

// Length of a run of `sign` characters that may be separated by whitespace,
// ending on the last sign. `count` receives the number of signs.
static std::size_t sign_run(std::string_view s, char sign, std::size_t& count) {
    count = 0;
    std::size_t end = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == sign) {
            ++count;
            end = ++i;
        } else if (is_space(s[i])) {
            ++i;
        } else {
            break;
        }
    }
    return end;
}

// -----------------------------
// Rule table
// -----------------------------
struct Rule {
    std::size_t (*match)(std::string_view s); // matched length at s[0], 0 if none
    Token (*make)(std::string_view text);
};

template <char C>
static std::size_t match_char(std::string_view s) {
    return !s.empty() && s[0] == C ? 1 : 0;
}

template <char C>
static std::size_t match_delimited_char(std::string_view s) {
    return !s.empty() && s[0] == C && delimited(s, 1) ? 1 : 0;
}

static std::size_t match_plus_run(std::string_view s) {
    std::size_t n = 0;
    return sign_run(s, '+', n);
}

static std::size_t match_minus_run(std::string_view s, bool even) {
    std::size_t n = 0;
    std::size_t len = sign_run(s, '-', n);
    if (n == 0 || (n % 2 == 0) != even) return 0;
    return delimited(s, len) ? len : 0;
}

static std::size_t match_even_minus(std::string_view s) { return match_minus_run(s, true); }
static std::size_t match_odd_minus(std::string_view s) { return match_minus_run(s, false); }

static std::size_t match_integer(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    std::size_t digits = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i == digits) return 0;
    return delimited(s, i) ? i : 0;
}

static std::size_t match_identifier(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && is_letter(s[i])) ++i;
    if (i == 0) return 0;
    return delimited(s, i) ? i : 0;
}

template <Op O>
static Token make_op(std::string_view) { return O; }

static Token make_literal(std::string_view text) { return Operand::literal(parse_integer(text)); }
static Token make_identifier(std::string_view text) { return Operand::identifier(std::string(text)); }

// Operators come first so that parentheses and sign runs are never read as
// part of an operand.
static const Rule kRules[] = {
    {match_char<'('>,            make_op<Op::LeftParen>},
    {match_char<')'>,            make_op<Op::RightParen>},
    {match_plus_run,             make_op<Op::Add>},
    {match_even_minus,           make_op<Op::Add>},
    {match_odd_minus,            make_op<Op::Subtract>},
    {match_delimited_char<'*'>,  make_op<Op::Multiply>},
    {match_delimited_char<'/'>,  make_op<Op::Divide>},
    {match_delimited_char<'^'>,  make_op<Op::Power>},
    {match_integer,              make_literal},
    {match_identifier,           make_identifier},
};

// -----------------------------
// Lexer
// -----------------------------
void Lexer::skip_ws() {
    while (!is_end() && is_space(s_[i_])) ++i_;
}

std::string_view Lexer::remainder() {
    skip_ws();
    return s_.substr(i_);
}

std::optional<Token> Lexer::next() {
    skip_ws();
    if (is_end()) return std::nullopt;

    std::string_view rest = s_.substr(i_);
    for (const auto& rule : kRules) {
        std::size_t len = rule.match(rest);
        if (len == 0) continue;
        Token t = rule.make(rest.substr(0, len));
        i_ += len;
        return t;
    }

    throw ParseError(ErrorKind::LexFailure, "Invalid expression",
                     "no token matches at column " + std::to_string(i_ + 1) + ": '" + std::string(rest) + "'");
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    std::vector<Token> out;
    while (auto t = lex.next()) out.push_back(std::move(*t));
    return out;
}

// -----------------------------
// Whole-string checks
// -----------------------------
std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!is_letter(c)) return false;
    return true;
}

bool is_integer_literal(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i)
        if (!is_digit(s[i])) return false;
    return true;
}

mpz_class parse_integer(std::string_view s) {
    if (!is_integer_literal(s)) throw ParseError(ErrorKind::LexFailure, "Invalid expression", "not an integer: '" + std::string(s) + "'");
    if (s[0] == '+') s.remove_prefix(1); // GMP accepts '-' but not '+'
    return mpz_class(std::string(s), 10);
}

} // namespace bigcalc
