#include "builder/builderFactory.hpp"
#include "builder/jsonMessageBuilder.hpp"
#include "builder/xmlMessageBuilder.hpp"
#include "utils/utils.hpp"

#include <stdexcept>
#include <string>

std::unique_ptr<MessageBuilder> BuilderFactory::make(MessageFormat format) {
    switch (format) {
    case MessageFormat::JSON:
        return std::make_unique<JSONMessageBuilder>();
    case MessageFormat::XML:
        return std::make_unique<XMLMessageBuilder>();
    }
    throw std::invalid_argument("unknown message format " +
                                std::to_string(static_cast<int>(+(format))));
}
