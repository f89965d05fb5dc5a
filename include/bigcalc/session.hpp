#pragma once
#include <cstdio>
#include <string>
#include <string_view>

#include "bigcalc/environment.hpp"
#include "bigcalc/trace.hpp"

namespace bigcalc {

struct Options {
    bool debug{false};  // trace lexing and postfix conversion to stderr
    bool prompt{false}; // print "> " before each line
};

enum class LineKind {
    Help,
    Exit,
    Assignment,
    SingleNumber,
    Empty,
    Expression,
    UnknownCommand,
};

/// Classify a trimmed input line. Checked in declaration order.
LineKind classify(std::string_view line);

struct Reply {
    std::string text; // empty: print nothing
    bool quit{false};
};

/// One calculator session: owns the variables and answers input lines.
class Session {
public:
    explicit Session(const Options& options = Options{})
        : trace_(options.debug ? stderr : nullptr) {}

    /// Process one raw input line. Errors are turned into their message;
    /// nothing thrown by the pipeline escapes.
    Reply handle(std::string_view line);

    /// Lex, convert and evaluate an expression against this session's
    /// variables. Throws ParseError / EvalError.
    mpz_class evaluate(std::string_view expression) const;

    Environment& environment() { return env_; }
    const Environment& environment() const { return env_; }

    static const char* help_text();

private:
    Environment env_;
    Trace trace_;
};

} // namespace bigcalc
