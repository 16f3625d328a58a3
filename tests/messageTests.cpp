#include "builder/jsonMessageBuilder.hpp"
#include "message/message.hpp"

#include <gtest/gtest.h>
#include <sstream>

TEST(MessageFormatTest, Tags) {
    EXPECT_STREQ(toStr(MessageFormat::JSON), "JSON");
    EXPECT_STREQ(toStr(MessageFormat::XML), "XML");
    EXPECT_STREQ(toStr(static_cast<MessageFormat>(0x00)), "UNKNOWN_FORMAT");
}

TEST(MessageFormatTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseFormat("json"), MessageFormat::JSON);
    EXPECT_EQ(parseFormat("JSON"), MessageFormat::JSON);
    EXPECT_EQ(parseFormat("Xml"), MessageFormat::XML);
    EXPECT_FALSE(parseFormat("yaml").has_value());
    EXPECT_FALSE(parseFormat("").has_value());
    EXPECT_FALSE(parseFormat("jsonx").has_value());
}

TEST(MessageTest, AccessorsViewTheSameBytes) {
    JSONMessageBuilder builder;
    builder.setRecipient("r");
    builder.setText("t");
    auto result = builder.finalize();
    ASSERT_TRUE(result.has_value());

    const Message& msg = *result;
    EXPECT_EQ(msg.size(), msg.body().size());
    EXPECT_EQ(msg.span().size(), msg.size());
    EXPECT_EQ(msg.text().size(), msg.size());
    EXPECT_EQ(static_cast<char>(msg.body().front()), '{');
    EXPECT_EQ(msg.text().back(), '}');
}

TEST(MessageTest, CopiesAreIndependentValues) {
    JSONMessageBuilder builder;
    builder.setRecipient("r");
    auto first = builder.finalize();
    ASSERT_TRUE(first.has_value());
    Message copy = *first;

    builder.setRecipient("changed");
    auto second = builder.finalize();
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(copy.body(), first->body());
    EXPECT_NE(copy.body(), second->body());
}

TEST(MessageTest, StreamsFormatAndBody) {
    JSONMessageBuilder builder;
    auto result = builder.finalize();
    ASSERT_TRUE(result.has_value());

    std::ostringstream oss;
    oss << *result;
    EXPECT_EQ(oss.str(), "MESSAGE|format=JSON|size=" + std::to_string(result->size()) +
                             "|body=" + std::string(result->text()));
}

TEST(SerializationErrorTest, StreamsAllFields) {
    SerializationError err{statusCodes::SerializationStatus::INVALID_XML_CHAR,
                           MessageFormat::XML, "body", "INVALID_XML_CHAR at byte 3"};
    std::ostringstream oss;
    oss << err;
    EXPECT_EQ(oss.str(), "SERIALIZATION_ERROR|status=INVALID_XML_CHAR|format=XML"
                         "|field=body|detail=INVALID_XML_CHAR at byte 3");
}

TEST(SerializationErrorTest, StatusNames) {
    using statusCodes::SerializationStatus;
    EXPECT_STREQ(statusCodes::toStr(SerializationStatus::NULLSTATUS), "NULLSTATUS");
    EXPECT_STREQ(statusCodes::toStr(SerializationStatus::INVALID_UTF8), "INVALID_UTF8");
    EXPECT_STREQ(statusCodes::toStr(SerializationStatus::CODEC_FAILURE), "CODEC_FAILURE");
}
