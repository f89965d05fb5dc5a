#pragma once
#include <string_view>
#include <vector>

#include "bigcalc/program.hpp"
#include "bigcalc/token.hpp"
#include "bigcalc/trace.hpp"

namespace bigcalc {

/// Shunting-yard conversion from infix tokens to postfix.
///
/// Tokens are fed one at a time. Operands go straight to the output; operators
/// wait on a stack until an operator of lower tier (or a closing parenthesis)
/// flushes them. All operators are left-associative, so an equal-tier operator
/// on the stack is popped before the incoming one is pushed.
class PostfixConverter {
public:
    /// Throws ParseError(UnbalancedParentheses) on a ')' without a matching '('.
    void feed(const Token& t);

    /// Flush the operator stack and hand over the postfix sequence.
    /// Throws ParseError(UnbalancedParentheses) if a '(' was never closed.
    std::vector<Token> finish();

    int level() const { return level_; }
    const std::vector<Op>& operators() const { return opstack_; }

private:
    void feed_operator(Op op);

    std::vector<Token> output_;
    std::vector<Op> opstack_;
    int level_{0};
};

std::vector<Token> to_postfix(const std::vector<Token>& infix);

/// Lex and convert a single expression line.
/// Throws ParseError on malformed input.
Program compile(std::string_view input, const Trace& trace = Trace{});

} // namespace bigcalc
