#include "builder/jsonMessageBuilder.hpp"
#include "builder/xmlMessageBuilder.hpp"
#include "decode.hpp"
#include "director/sender.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

const std::string SANTA = "Santa Claus";
const std::string WISH = "I have tried to be good all year and hope that you and your "
                         "reindeers will be able to deliver me a nice present.";

// Records the call sequence and fails on finalize.
class RecordingBuilder : public MessageBuilder {
public:
    void setRecipient(std::string recipient) override {
        calls.push_back("setRecipient:" + recipient);
    }
    void setText(std::string text) override { calls.push_back("setText:" + text); }

    BuildResult finalize() const override {
        calls.push_back("finalize");
        SerializationError err;
        err.status = statusCodes::SerializationStatus::CODEC_FAILURE;
        err.format = MessageFormat::XML;
        err.field = "body";
        err.detail = "codec exploded";
        return std::unexpected(err);
    }

    mutable std::vector<std::string> calls;
};

} // namespace

class SenderTest : public ::testing::Test {
protected:
    Sender sender;
};

TEST_F(SenderTest, JsonScenario) {
    JSONMessageBuilder builder;
    auto result = sender.buildMessage(builder);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format(), MessageFormat::JSON);

    auto doc = nlohmann::json::parse(std::string(result->text()));
    nlohmann::json expected = {{"recipient", SANTA}, {"message", WISH}};
    EXPECT_EQ(doc, expected);
}

TEST_F(SenderTest, XmlScenario) {
    XMLMessageBuilder builder;
    auto result = sender.buildMessage(builder);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->format(), MessageFormat::XML);
    EXPECT_EQ(decodeXML(*result), (DecodedMessage{SANTA, WISH}));
    EXPECT_EQ(result->text(), "<XMLMessage><recipient>Santa Claus</recipient><body>" +
                                  WISH + "</body></XMLMessage>");
}

TEST_F(SenderTest, SameLogicalMessageForEveryBuilder) {
    JSONMessageBuilder json;
    XMLMessageBuilder xml;

    auto fromJson = sender.buildMessage(json);
    auto fromXml = sender.buildMessage(xml);
    ASSERT_TRUE(fromJson.has_value());
    ASSERT_TRUE(fromXml.has_value());

    EXPECT_EQ(decodeJSON(*fromJson), decodeXML(*fromXml));
    EXPECT_NE(fromJson->text(), fromXml->text());
}

TEST_F(SenderTest, DeterministicAcrossFreshBuilders) {
    for (int i = 0; i < 3; ++i) {
        JSONMessageBuilder json;
        XMLMessageBuilder xml;

        auto a = sender.buildMessage(json);
        auto b = sender.buildMessage(xml);
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());
        EXPECT_EQ(decodeJSON(*a), (DecodedMessage{SANTA, WISH}));
        EXPECT_EQ(decodeXML(*b), (DecodedMessage{SANTA, WISH}));
    }
}

TEST_F(SenderTest, OverridesEarlierSetterValues) {
    JSONMessageBuilder builder;
    builder.setRecipient("Grinch");
    builder.setText("nothing");

    auto result = sender.buildMessage(builder);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(decodeJSON(*result), (DecodedMessage{SANTA, WISH}));
}

TEST_F(SenderTest, CallsSettersThenFinalizeInOrder) {
    RecordingBuilder builder;
    auto result = sender.buildMessage(builder);
    (void)result;

    std::vector<std::string> expected = {"setRecipient:" + SANTA, "setText:" + WISH,
                                         "finalize"};
    EXPECT_EQ(builder.calls, expected);
}

TEST_F(SenderTest, PropagatesBuilderErrorUnchanged) {
    RecordingBuilder builder;
    auto result = sender.buildMessage(builder);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().status, statusCodes::SerializationStatus::CODEC_FAILURE);
    EXPECT_EQ(result.error().format, MessageFormat::XML);
    EXPECT_EQ(result.error().field, "body");
    EXPECT_EQ(result.error().detail, "codec exploded");
}

TEST(SenderDefaults, FixedValues) {
    EXPECT_EQ(Sender::Defaults::recipient, SANTA);
    EXPECT_EQ(Sender::Defaults::text, WISH);
}
