#pragma once

#include "message/message.hpp"

#include <expected>
#include <string>

using BuildResult = std::expected<Message, SerializationError>;

// Accumulates recipient and text, then encodes them on finalize(). Instances
// carry no synchronization: one construction sequence per instance at a time.
class MessageBuilder {
public:
    virtual ~MessageBuilder() = default;

    virtual void setRecipient(std::string recipient) = 0;
    virtual void setText(std::string text) = 0;

    // Unset fields encode as empty strings. May be called repeatedly.
    virtual BuildResult finalize() const = 0;
};
