#include "CommandModulesTest.hpp"

class PhoneCommandTest : public CommandTestBase {
   public:
    PhoneCommandTest() : CommandTestBase("phone") {}
    ~PhoneCommandTest() override = default;
};

TEST_F(PhoneCommandTest, NoArguments) {
    setCommandExtArgs();
    EXPECT_EQ(execute(), "Error: Missing name.");
}

TEST_F(PhoneCommandTest, NotFound) {
    setCommandExtArgs({TEST_NAME});
    EXPECT_EQ(execute(), "Contact not found.");
}

TEST_F(PhoneCommandTest, AddThenQuery) {
    addContact(TEST_NAME, TEST_PHONE);
    setCommandExtArgs({TEST_NAME});
    const auto reply = execute();
    EXPECT_THAT(reply, HasSubstr(TEST_NAME));
    EXPECT_THAT(reply, HasSubstr(TEST_PHONE));
}

TEST_F(PhoneCommandTest, ShowsBirthdayWhenSet) {
    addContact(TEST_NAME, TEST_PHONE);
    ASSERT_EQ(run("add-birthday", {TEST_NAME, TEST_BIRTHDAY}),
              "Birthday added to the contact.");
    setCommandExtArgs({TEST_NAME});
    EXPECT_EQ(execute(),
              "Contact name: Alice, phones: 1234567890, birthday: 15.06.1990");
}

TEST_F(PhoneCommandTest, ExtraArgumentsIgnored) {
    addContact(TEST_NAME, TEST_PHONE);
    setCommandExtArgs({TEST_NAME, "whatever"});
    EXPECT_EQ(execute(), "Contact name: Alice, phones: 1234567890");
}
