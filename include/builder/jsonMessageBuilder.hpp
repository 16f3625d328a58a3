#pragma once

#include "builder/messageBuilder.hpp"

#include <string>

// {"recipient": ..., "message": ...}
class JSONMessageBuilder : public MessageBuilder {
public:
    void setRecipient(std::string recipient) override;
    void setText(std::string text) override;

    BuildResult finalize() const override;

private:
    std::string messageRecipient_;
    std::string messageText_;
};
