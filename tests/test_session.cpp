#include <gtest/gtest.h>
#include <bigcalc/error.hpp>
#include <bigcalc/session.hpp>

#include <string>

namespace {

using namespace bigcalc;

TEST(Session, ClassifiesLines) {
    EXPECT_EQ(classify("/help"), LineKind::Help);
    EXPECT_EQ(classify("/exit"), LineKind::Exit);
    EXPECT_EQ(classify("x = 5"), LineKind::Assignment);
    EXPECT_EQ(classify("x1=y"), LineKind::Assignment);
    EXPECT_EQ(classify("-42"), LineKind::SingleNumber);
    EXPECT_EQ(classify(""), LineKind::Empty);
    EXPECT_EQ(classify("1 + x"), LineKind::Expression);
    EXPECT_EQ(classify("(x) = 3"), LineKind::Expression);
    EXPECT_EQ(classify("/go"), LineKind::UnknownCommand);
    EXPECT_EQ(classify("/help me"), LineKind::UnknownCommand);
}

TEST(Session, EvaluatesExpressions) {
    Session s;
    EXPECT_EQ(s.handle("3 + 4").text, "7");
    EXPECT_EQ(s.handle("  (2 + 3) * 4  ").text, "20");
    EXPECT_EQ(s.handle("2 ^ 3 ^ 2").text, "64");
}

TEST(Session, AssignmentRoundTrip) {
    Session s;
    Reply r = s.handle("x = 5");
    EXPECT_TRUE(r.text.empty());
    EXPECT_FALSE(r.quit);
    EXPECT_EQ(s.handle("x + 1").text, "6");
    EXPECT_EQ(s.handle("x").text, "5");

    s.handle("x = -10");
    EXPECT_EQ(s.handle("x * 2").text, "-20");

    s.handle("y=x");
    EXPECT_EQ(s.handle("y").text, "-10");
}

TEST(Session, FailedAssignmentKeepsOldValue) {
    Session s;
    s.handle("y = 2");
    EXPECT_EQ(s.handle("y = z").text, "Unknown variable");
    EXPECT_EQ(s.environment().at("y"), 2);
    EXPECT_FALSE(s.environment().contains("z"));
}

TEST(Session, InvalidIdentifiers) {
    Session s;
    EXPECT_EQ(s.handle("a1 = 3").text, "Invalid identifier");
    EXPECT_EQ(s.handle("a = 1 + 2").text, "Invalid identifier");
    EXPECT_EQ(s.handle("a = b1").text, "Invalid identifier");
    EXPECT_EQ(s.handle("a =").text, "Invalid identifier");
    EXPECT_EQ(s.environment().size(), 0u);
}

TEST(Session, ErrorsAreLocalToTheLine) {
    Session s;
    EXPECT_EQ(s.handle("undefinedVar + 1").text, "Unknown variable");
    EXPECT_EQ(s.handle("1 / 0").text, "Division by zero");
    EXPECT_EQ(s.handle("2 ^ (0 - 3)").text, "Invalid exponent");
    EXPECT_EQ(s.handle("(1 + 2").text, "Invalid expression");
    EXPECT_EQ(s.handle("1 + 2)").text, "Invalid expression");
    EXPECT_EQ(s.handle("2 $ 2").text, "Invalid expression");
    EXPECT_EQ(s.handle("1 +").text, "Invalid expression");
    EXPECT_EQ(s.handle("1 + 1").text, "2");
}

TEST(Session, HugePowerDoesNotEndTheSession) {
    Session s;
    EXPECT_EQ(s.handle("16 ^ 40000000000").text, "Invalid exponent");
    EXPECT_EQ(s.handle("1 + 1").text, "2");
}

TEST(Session, SingleNumbersAreEchoed) {
    Session s;
    EXPECT_EQ(s.handle("+007").text, "7");
    EXPECT_EQ(s.handle("-12").text, "-12");
    EXPECT_EQ(s.handle("123456789012345678901234567890").text, "123456789012345678901234567890");
}

TEST(Session, BlankLinesProduceNothing) {
    Session s;
    EXPECT_TRUE(s.handle("").text.empty());
    EXPECT_TRUE(s.handle("   \t ").text.empty());
}

TEST(Session, Commands) {
    Session s;
    EXPECT_EQ(s.handle("/help").text, Session::help_text());
    EXPECT_FALSE(s.handle("/help").quit);
    EXPECT_EQ(s.handle("/reset").text, "Unknown command");

    Reply bye = s.handle("/exit");
    EXPECT_EQ(bye.text, "Bye!");
    EXPECT_TRUE(bye.quit);
}

TEST(Session, RepeatedLinesGiveTheSameResult) {
    Session s;
    s.handle("n = 7");
    std::string first = s.handle("(n + 3) ^ 20 / n").text;
    EXPECT_EQ(s.handle("(n + 3) ^ 20 / n").text, first);
    EXPECT_EQ(first, "14285714285714285714");
}

TEST(Session, EvaluateThrowsInsteadOfReplying) {
    Session s;
    EXPECT_EQ(s.evaluate("6 * 7"), 42);
    EXPECT_THROW(s.evaluate("q"), EvalError);
    EXPECT_THROW(s.evaluate("(q"), ParseError);
}

} // namespace
