#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <InteractiveLoop.hpp>
#include <sstream>
#include <string>

#include "mocks/Clock.hpp"

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::NiceMock;

TEST(ParseInputTest, SplitsOnWhitespace) {
    const auto parsed = parseInput("  add   Alice\t1234567890  ");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->command, "add");
    EXPECT_THAT(parsed->args, ElementsAre("Alice", "1234567890"));
}

TEST(ParseInputTest, LowersCommandOnly) {
    const auto parsed = parseInput("Add-Birthday Alice 15.06.1990");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->command, "add-birthday");
    EXPECT_THAT(parsed->args, ElementsAre("Alice", "15.06.1990"));
}

TEST(ParseInputTest, CommandWithoutArguments) {
    const auto parsed = parseInput("all");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->command, "all");
    EXPECT_THAT(parsed->args, IsEmpty());
}

TEST(ParseInputTest, BlankLine) {
    EXPECT_FALSE(parseInput("").has_value());
    EXPECT_FALSE(parseInput(" \t ").has_value());
}

TEST(ParseInputTest, ExitSentinel) {
    EXPECT_TRUE(isExitCommand("exit"));
    EXPECT_TRUE(isExitCommand("CLOSE"));
    EXPECT_TRUE(isExitCommand("Exit\r"));
    EXPECT_FALSE(isExitCommand("exit now"));
    EXPECT_FALSE(isExitCommand("quit"));
}

class InteractiveLoopTest : public ::testing::Test {
   protected:
    InteractiveLoopTest() : provider(&clock), dispatcher(&provider) {}

    size_t runWith(const std::string& input) {
        in.str(input);
        InteractiveLoop loop(&dispatcher, in, out);
        return loop.run(book);
    }

    NiceMock<MockClock> clock;
    Providers provider;
    CommandDispatcher dispatcher;
    AddressBook book;
    std::istringstream in;
    std::ostringstream out;
};

TEST_F(InteractiveLoopTest, Session) {
    EXPECT_EQ(runWith("hello\n"
                      "add Alice 1234567890\n"
                      "\n"
                      "phone Alice\n"
                      "foobar\n"
                      "exit\n"
                      "all\n"),
              4U);
    EXPECT_EQ(out.str(),
              "Welcome to the assistant bot!\n"
              "Enter a command: How can I help you?\n"
              "Enter a command: Contact added.\n"
              "Enter a command: "
              "Enter a command: Contact name: Alice, phones: 1234567890\n"
              "Enter a command: Invalid command.\n"
              "Enter a command: Goodbye!\n");
    EXPECT_EQ(book.size(), 1U);
}

TEST_F(InteractiveLoopTest, EndOfInputEndsSession) {
    EXPECT_EQ(runWith("add Alice 1234567890"), 1U);
    EXPECT_THAT(out.str(), HasSubstr("Contact added.\n"));
    EXPECT_THAT(out.str(), testing::EndsWith("Enter a command: \nGoodbye!\n"));
}

TEST_F(InteractiveLoopTest, ErrorsDoNotEndSession) {
    EXPECT_EQ(runWith("add\n"
                      "add Alice 12\n"
                      "change Bob 1234567890 1111111111\n"
                      "CLOSE\n"),
              3U);
    EXPECT_THAT(out.str(), HasSubstr("Error: Missing name or phone number.\n"));
    EXPECT_THAT(out.str(), HasSubstr("Phone number must be 10 digits\n"));
    EXPECT_THAT(out.str(), HasSubstr("Contact not found.\n"));
    EXPECT_THAT(out.str(), testing::EndsWith("Goodbye!\n"));
    EXPECT_TRUE(book.empty());
}
