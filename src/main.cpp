#include <AbslLogCompat.hpp>
#include <fmt/format.h>

#include <Clock.hpp>
#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <InteractiveLoop.hpp>
#include <SpdlogInit.hpp>
#include <addressbook/AddressBook.hpp>
#include <api/CommandDispatcher.hpp>
#include <api/Providers.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace {

// Applies the logging related configs, returns false on bad values.
bool applyLogConfigs(const ConfigManager& config) {
    if (const auto level = config.get(ConfigManager::Configs::LOG_LEVEL)) {
        if (!AssistantBot_SpdlogSetLevel(*level)) {
            LOG(ERROR) << "Unknown log level: " << *level;
            return false;
        }
    }
    if (const auto file = config.get(ConfigManager::Configs::LOG_FILE)) {
        if (!AssistantBot_SpdlogAddFileSink(*file)) {
            return false;
        }
        LOG(INFO) << "Logging to " << *file;
    }
    return true;
}

}  // namespace

int app_main(int argc, char** argv) {
    std::optional<ConfigManager> config;
    try {
        config.emplace(CommandLine{argc, argv});
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "Failed to read the command line: " << e.what();
        return EXIT_FAILURE;
    }

    if (config->get(ConfigManager::Configs::HELP)) {
        std::cout << fmt::format("Usage: {} [options]", argv[0]) << std::endl
                  << std::endl;
        ConfigManager::serializeHelpToOStream(std::cout);
        std::cout << CommandHelpers::getHelpText();
        return EXIT_SUCCESS;
    }
    if (!applyLogConfigs(*config)) {
        return EXIT_FAILURE;
    }

    SystemClock clock;
    Providers provider(&clock);
    CommandDispatcher dispatcher(&provider);
    AddressBook book;

    InteractiveLoop loop(&dispatcher, std::cin, std::cout);
    const auto count = loop.run(book);
    LOG(INFO) << fmt::format("Session ended after {} commands, {} contacts",
                             count, book.size());
    return EXIT_SUCCESS;
}
