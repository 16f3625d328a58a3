#pragma once

#include "builder/messageBuilder.hpp"

#include <string>

// <XMLMessage><recipient>...</recipient><body>...</body></XMLMessage>
class XMLMessageBuilder : public MessageBuilder {
public:
    void setRecipient(std::string recipient) override;
    void setText(std::string text) override;

    BuildResult finalize() const override;

private:
    std::string messageRecipient_;
    std::string messageText_;
};
