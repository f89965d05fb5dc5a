#include "bigcalc/parser.hpp"
#include "bigcalc/lexer.hpp"

#include <utility>

namespace bigcalc {

void PostfixConverter::feed(const Token& t) {
    if (const auto* op = std::get_if<Op>(&t)) {
        feed_operator(*op);
        return;
    }
    output_.push_back(t);
}

void PostfixConverter::feed_operator(Op op) {
    if (op == Op::LeftParen) {
        opstack_.push_back(op);
        ++level_;
        return;
    }

    if (op == Op::RightParen) {
        --level_;
        while (!opstack_.empty() && opstack_.back() != Op::LeftParen) {
            output_.emplace_back(opstack_.back());
            opstack_.pop_back();
        }
        if (opstack_.empty() || level_ < 0) throw ParseError(ErrorKind::UnbalancedParentheses, "Invalid expression", "unmatched ')'");
        opstack_.pop_back(); // discard '('
        return;
    }

    while (!opstack_.empty() && !is_paren(opstack_.back()) && tier(opstack_.back()) >= tier(op)) {
        output_.emplace_back(opstack_.back());
        opstack_.pop_back();
    }
    opstack_.push_back(op);
}

std::vector<Token> PostfixConverter::finish() {
    if (level_ != 0) throw ParseError(ErrorKind::UnbalancedParentheses, "Invalid expression", "unmatched '('");

    while (!opstack_.empty()) {
        output_.emplace_back(opstack_.back());
        opstack_.pop_back();
    }
    return std::move(output_);
}

std::vector<Token> to_postfix(const std::vector<Token>& infix) {
    PostfixConverter conv;
    for (const auto& t : infix) conv.feed(t);
    return conv.finish();
}

static std::string join_ops(const std::vector<Op>& ops) {
    std::string s;
    for (Op op : ops) {
        if (!s.empty()) s += ' ';
        s += to_string(op);
    }
    return s;
}

Program compile(std::string_view input, const Trace& trace) {
    Lexer lex(input);
    PostfixConverter conv;

    for (;;) {
        if (trace.enabled()) trace("remainder: {}", lex.remainder());
        auto t = lex.next();
        if (!t) break;

        conv.feed(*t);
        if (trace.enabled()) {
            if (std::holds_alternative<Op>(*t))
                trace("operator: {}  stack: [{}]", to_string(*t), join_ops(conv.operators()));
            else
                trace("operand: {}", to_string(*t));
        }
    }

    Program p;
    p.postfix = conv.finish();
    if (trace.enabled()) trace("postfix: {}", p.to_string());
    return p;
}

} // namespace bigcalc
