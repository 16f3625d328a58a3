#pragma once

#include "builder/messageBuilder.hpp"

#include <string_view>

// Director: runs the fixed construction sequence against any builder. Holds
// no state, so one Sender can drive any number of builders.
class Sender {
public:
    struct Defaults {
        static constexpr std::string_view recipient = "Santa Claus";
        static constexpr std::string_view text =
            "I have tried to be good all year and hope that you and your reindeers "
            "will be able to deliver me a nice present.";
    };

    BuildResult buildMessage(MessageBuilder& builder) const;
};
