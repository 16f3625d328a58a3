#include "builder/builderFactory.hpp"
#include "config/demoConfig.hpp"
#include "director/sender.hpp"
#include "logger/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    try {
        DemoConfig config = DemoConfig::fromArgs(argc, argv);

        auto logger = std::make_unique<Logger>(config.logFile, config.loggingEnabled);
        logger->log("demo started", "MAIN");

        Sender sender;

        for (MessageFormat format : config.formats) {
            auto builder = BuilderFactory::make(format);

            BuildResult result = sender.buildMessage(*builder);
            if (!result) {
                logger->log(result.error());
                std::cerr << result.error() << std::endl;
                return EXIT_FAILURE;
            }

            logger->log(*result);
            std::cout << result->text() << std::endl;
        }

        logger->log("demo finished", "MAIN");
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
