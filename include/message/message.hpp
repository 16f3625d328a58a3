#pragma once

#include "message/messageTypes.hpp"
#include "message/statusCodes.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

class JSONMessageBuilder;
class XMLMessageBuilder;

// Finished, immutable output of a builder. Only the concrete builders can
// construct one.
class Message {
public:
    const MessageBuffer& body() const { return body_; }
    MessageView span() const { return body_; }
    std::size_t size() const { return body_.size(); }
    MessageFormat format() const { return format_; }
    const char* formatTag() const { return toStr(format_); }

    std::string_view text() const {
        return {reinterpret_cast<const char*>(body_.data()), body_.size()};
    }

private:
    friend class JSONMessageBuilder;
    friend class XMLMessageBuilder;

    Message(MessageBuffer body, MessageFormat format)
        : body_(std::move(body)), format_(format) {}

    static Message fromString(const std::string& encoded, MessageFormat format) {
        MessageBuffer buffer(encoded.size());
        std::ranges::transform(encoded, buffer.begin(),
                               [](char c) { return static_cast<std::byte>(c); });
        return Message{std::move(buffer), format};
    }

    MessageBuffer body_;
    MessageFormat format_;
};

inline std::ostream& operator<<(std::ostream& os, const Message& m) {
    return os << "MESSAGE|format=" << m.format() << "|size=" << m.size()
              << "|body=" << m.text();
}

struct SerializationError {
    statusCodes::SerializationStatus status{statusCodes::SerializationStatus::NULLSTATUS};
    MessageFormat format{MessageFormat::JSON};
    std::string field;
    std::string detail;
};

inline std::ostream& operator<<(std::ostream& os, const SerializationError& e) {
    os << "SERIALIZATION_ERROR|status=" << statusCodes::toStr(e.status)
       << "|format=" << e.format;
    if (!e.field.empty()) os << "|field=" << e.field;
    return os << "|detail=" << e.detail;
}
