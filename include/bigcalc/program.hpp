#pragma once
#include <string>
#include <vector>

#include "bigcalc/environment.hpp"
#include "bigcalc/token.hpp"

namespace bigcalc {

/// A compiled expression in postfix order.
struct Program {
    std::vector<Token> postfix;

    /// Run the postfix sequence on a value stack.
    /// Throws EvalError on unknown variables, missing operands, leftover
    /// operands and arithmetic faults.
    mpz_class evaluate(const Environment& env) const;

    /// Space-separated postfix form, e.g. "2 3 + 4 *".
    std::string to_string() const;
};

} // namespace bigcalc
