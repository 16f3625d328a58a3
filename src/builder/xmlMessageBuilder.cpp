#include "builder/xmlMessageBuilder.hpp"
#include "utils/utf8.hpp"

#include <pugixml.hpp>

#include <optional>
#include <string_view>
#include <utility>

namespace {

// pugixml leaves CR unescaped in PCDATA and any reader folds it into LF, so
// CR goes out as a character reference. The document has no attributes and
// no formatting whitespace, so every CR here belongs to element text.
struct StringWriter : pugi::xml_writer {
    std::string result;
    void write(const void* data, size_t size) override {
        const char* bytes = static_cast<const char*>(data);
        for (size_t i = 0; i < size; ++i) {
            if (bytes[i] == '\r')
                result += "&#13;";
            else
                result.push_back(bytes[i]);
        }
    }
};

// pugixml emits whatever bytes it is handed, so anything that would make the
// document ill-formed has to be caught before encoding.
std::optional<SerializationError> checkField(std::string_view name,
                                             const std::string& value) {
    auto violation = utils::validateXmlText(value);
    if (!violation) return std::nullopt;

    SerializationError err;
    err.status = violation->status;
    err.format = MessageFormat::XML;
    err.field = name;
    err.detail = std::string(statusCodes::toStr(violation->status)) + " at byte " +
                 std::to_string(violation->offset);
    return err;
}

} // namespace

void XMLMessageBuilder::setRecipient(std::string recipient) {
    messageRecipient_ = std::move(recipient);
}

void XMLMessageBuilder::setText(std::string text) { messageText_ = std::move(text); }

BuildResult XMLMessageBuilder::finalize() const {
    if (auto err = checkField(fields::RECIPIENT, messageRecipient_)) {
        return std::unexpected(std::move(*err));
    }
    if (auto err = checkField(fields::XML_TEXT, messageText_)) {
        return std::unexpected(std::move(*err));
    }

    pugi::xml_document doc;
    pugi::xml_node root = doc.append_child(fields::XML_ROOT.data());

    pugi::xml_node recipient = root.append_child(fields::RECIPIENT.data());
    pugi::xml_node body = root.append_child(fields::XML_TEXT.data());

    if (!root || !recipient || !body || !recipient.text().set(messageRecipient_.c_str()) ||
        !body.text().set(messageText_.c_str())) {
        SerializationError err;
        err.status = statusCodes::SerializationStatus::CODEC_FAILURE;
        err.format = MessageFormat::XML;
        err.detail = "pugixml failed to build the document";
        return std::unexpected(std::move(err));
    }

    StringWriter writer;
    doc.save(writer, "", pugi::format_raw | pugi::format_no_declaration);

    return Message::fromString(writer.result, MessageFormat::XML);
}
