#include "config/demoConfig.hpp"
#include "utils/utils.hpp"

#include <stdexcept>

std::vector<MessageFormat> DemoConfig::parseFormats(std::string_view list) {
    if (utils::equalsNoCase(list, "all")) return {MessageFormat::JSON, MessageFormat::XML};

    std::vector<MessageFormat> out;
    while (true) {
        auto comma = list.find(',');
        std::string_view item = list.substr(0, comma);

        auto format = parseFormat(item);
        if (!format) {
            throw std::invalid_argument("unknown format '" + std::string(item) +
                                        "' (expected json, xml or all)");
        }
        out.push_back(*format);

        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return out;
}

DemoConfig DemoConfig::fromArgs(int argc, const char* const* argv) {
    if (argc > 3) {
        throw std::invalid_argument("usage: minibuilder_demo [all|json|xml] [logfile]");
    }

    DemoConfig config;
    config.formats = parseFormats(argc > 1 ? argv[1] : Defaults::formats);

    if (argc > 2) {
        config.logFile = argv[2];
        config.loggingEnabled = !config.logFile.empty();
    }
    return config;
}
