#include <gtest/gtest.h>

#include <addressbook/Record.hpp>
#include <memory>
#include <sstream>

class RecordTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto created = Record::create("Alice");
        ASSERT_TRUE(created.ok());
        record = std::make_unique<Record>(*std::move(created));
    }

    std::unique_ptr<Record> record;
};

TEST_F(RecordTest, CreateWithBirthday) {
    const auto created = Record::create("Bob", "15.06.1990");
    ASSERT_TRUE(created.ok());
    ASSERT_TRUE(created->birthday().has_value());
    EXPECT_EQ(created->birthday()->value(), "15.06.1990");
}

TEST_F(RecordTest, CreateWithInvalidBirthday) {
    EXPECT_FALSE(Record::create("Bob", "31.06.1990").ok());
}

TEST_F(RecordTest, RenderWithoutPhones) {
    EXPECT_EQ(record->toString(), "Contact name: Alice, phones: ");
}

TEST_F(RecordTest, AddPhoneKeepsOrderAndDuplicates) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    ASSERT_TRUE(record->addPhone("0987654321").ok());
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    EXPECT_EQ(record->toString(),
              "Contact name: Alice, phones: 1234567890, 0987654321, 1234567890");
}

TEST_F(RecordTest, AddInvalidPhone) {
    EXPECT_FALSE(record->addPhone("12345").ok());
    EXPECT_TRUE(record->phones().empty());
}

TEST_F(RecordTest, RemovePhoneRemovesAllMatches) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    ASSERT_TRUE(record->addPhone("0987654321").ok());
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    record->removePhone("1234567890");
    ASSERT_EQ(record->phones().size(), 1U);
    EXPECT_EQ(record->phones()[0].value(), "0987654321");
}

TEST_F(RecordTest, RemoveMissingPhoneIsNoop) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    record->removePhone("0000000000");
    EXPECT_EQ(record->phones().size(), 1U);
}

TEST_F(RecordTest, EditPhone) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    const auto edited = record->editPhone("1234567890", "1111111111");
    ASSERT_TRUE(edited.ok());
    EXPECT_TRUE(*edited);
    EXPECT_NE(record->findPhone("1111111111"), nullptr);
    EXPECT_EQ(record->findPhone("1234567890"), nullptr);
}

TEST_F(RecordTest, EditMissingPhone) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    const auto edited = record->editPhone("0987654321", "1111111111");
    ASSERT_TRUE(edited.ok());
    EXPECT_FALSE(*edited);
    EXPECT_EQ(record->phones()[0].value(), "1234567890");
}

TEST_F(RecordTest, EditToInvalidPhone) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    const auto edited = record->editPhone("1234567890", "abc");
    EXPECT_FALSE(edited.ok());
    EXPECT_EQ(record->phones()[0].value(), "1234567890");
}

TEST_F(RecordTest, BirthdayOverwriteAndRender) {
    ASSERT_TRUE(record->addPhone("1234567890").ok());
    ASSERT_TRUE(record->addBirthday("01.01.2000").ok());
    ASSERT_TRUE(record->addBirthday("15.06.1990").ok());
    std::ostringstream ss;
    ss << *record;
    EXPECT_EQ(ss.str(),
              "Contact name: Alice, phones: 1234567890, birthday: 15.06.1990");
}
