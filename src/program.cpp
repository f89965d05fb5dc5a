#include "bigcalc/program.hpp"
#include "bigcalc/error.hpp"

namespace bigcalc {

mpz_class Program::evaluate(const Environment& env) const {
    std::vector<mpz_class> st;
    st.reserve(postfix.size());

    auto pop = [&]() -> mpz_class {
        if (st.empty()) throw EvalError(ErrorKind::StackUnderflow, "Invalid expression", "operator is missing an operand");
        mpz_class v = std::move(st.back());
        st.pop_back();
        return v;
    };

    for (const auto& t : postfix) {
        if (const auto* operand = std::get_if<Operand>(&t)) {
            st.push_back(resolve(*operand, env));
            continue;
        }

        Op op = std::get<Op>(t);
        mpz_class b = pop();
        mpz_class a = pop();
        st.push_back(apply(op, a, b));
    }

    if (st.size() != 1) {
        throw EvalError(ErrorKind::StackUnderflow, "Invalid expression",
                        st.empty() ? "empty expression" : "expression left " + std::to_string(st.size()) + " values");
    }
    return std::move(st.back());
}

std::string Program::to_string() const {
    std::string s;
    for (const auto& t : postfix) {
        if (!s.empty()) s += ' ';
        s += bigcalc::to_string(t);
    }
    return s;
}

} // namespace bigcalc
