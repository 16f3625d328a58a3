#include "director/sender.hpp"

#include <string>

BuildResult Sender::buildMessage(MessageBuilder& builder) const {
    builder.setRecipient(std::string(Defaults::recipient));
    builder.setText(std::string(Defaults::text));
    return builder.finalize();
}
