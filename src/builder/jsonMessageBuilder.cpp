#include "builder/jsonMessageBuilder.hpp"
#include "utils/utf8.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace {
// nlohmann::json::type_error id for an invalid UTF-8 byte during dump()
constexpr int JSON_INVALID_UTF8 = 316;

bool isIllFormed(const std::string& s) { return utils::validateUtf8(s).has_value(); }
} // namespace

void JSONMessageBuilder::setRecipient(std::string recipient) {
    messageRecipient_ = std::move(recipient);
}

void JSONMessageBuilder::setText(std::string text) { messageText_ = std::move(text); }

BuildResult JSONMessageBuilder::finalize() const {
    nlohmann::json doc = nlohmann::json::object();
    doc[std::string(fields::RECIPIENT)] = messageRecipient_;
    doc[std::string(fields::JSON_TEXT)] = messageText_;

    std::string encoded;
    try {
        encoded = doc.dump();
    } catch (const nlohmann::json::exception& e) {
        SerializationError err;
        err.format = MessageFormat::JSON;
        err.detail = e.what();

        if (e.id == JSON_INVALID_UTF8) {
            err.status = statusCodes::SerializationStatus::INVALID_UTF8;
            if (isIllFormed(messageRecipient_)) {
                err.field = fields::RECIPIENT;
            } else if (isIllFormed(messageText_)) {
                err.field = fields::JSON_TEXT;
            }
        } else {
            err.status = statusCodes::SerializationStatus::CODEC_FAILURE;
        }
        return std::unexpected(std::move(err));
    }

    return Message::fromString(encoded, MessageFormat::JSON);
}
