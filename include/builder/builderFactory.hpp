#pragma once

#include "builder/messageBuilder.hpp"
#include "message/messageTypes.hpp"

#include <memory>

struct BuilderFactory {
    static std::unique_ptr<MessageBuilder> make(MessageFormat format);
};
