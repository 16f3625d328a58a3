#pragma once

#include "message/messageTypes.hpp"

#include <string>
#include <string_view>
#include <vector>

// Command line: minibuilder_demo [all|json|xml|json,xml] [logfile]
struct DemoConfig {
    struct Defaults {
        static constexpr std::string_view formats = "all";
        static constexpr bool loggingEnabled = false;
    };

    std::vector<MessageFormat> formats{MessageFormat::JSON, MessageFormat::XML};
    std::string logFile;
    bool loggingEnabled{Defaults::loggingEnabled};

    // Throws std::invalid_argument on bad input.
    static DemoConfig fromArgs(int argc, const char* const* argv);
    static std::vector<MessageFormat> parseFormats(std::string_view list);
};
