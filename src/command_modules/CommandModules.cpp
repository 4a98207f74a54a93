#include <AbslLogCompat.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "CommandModule.h"

namespace CommandHelpers {

namespace {

using ValidArgs = CommandModule::ValidArgs;

constexpr std::array<CommandModule, static_cast<int>(Command::kMax)>
    kCommandArray{
        CommandModule{Command::kAdd, "add",
                      "Add a contact, or a phone to an existing contact",
                      COMMAND_HANDLER_NAME(add),
                      {2, 2, "Error: Missing name or phone number.",
                       "add <name> <phone>"}},
        CommandModule{Command::kChange, "change",
                      "Replace a phone number of a contact",
                      COMMAND_HANDLER_NAME(change),
                      {3, 3,
                       "Error: Missing name, old phone, or new phone number.",
                       "change <name> <old phone> <new phone>"}},
        CommandModule{Command::kPhone, "phone", "Show a contact",
                      COMMAND_HANDLER_NAME(phone),
                      {1, ValidArgs::kUnlimited, "Error: Missing name.",
                       "phone <name>"}},
        CommandModule{Command::kAll, "all", "Show all contacts",
                      COMMAND_HANDLER_NAME(all),
                      {0, ValidArgs::kUnlimited, "", "all"}},
        CommandModule{Command::kAddBirthday, "add-birthday",
                      "Set the birthday of a contact",
                      COMMAND_HANDLER_NAME(add_birthday),
                      {2, 2, "Error: Missing name or birthday.",
                       "add-birthday <name> <DD.MM.YYYY>"}},
        CommandModule{Command::kShowBirthday, "show-birthday",
                      "Show the birthday of a contact",
                      COMMAND_HANDLER_NAME(show_birthday),
                      {1, ValidArgs::kUnlimited, "Error: Missing name.",
                       "show-birthday <name>"}},
        CommandModule{Command::kBirthdays, "birthdays",
                      "List birthdays within the next week",
                      COMMAND_HANDLER_NAME(birthdays),
                      {0, ValidArgs::kUnlimited, "", "birthdays"}},
        CommandModule{Command::kHello, "hello", "Greet the bot",
                      COMMAND_HANDLER_NAME(hello),
                      {0, ValidArgs::kUnlimited, "", "hello"}},
    };

constexpr bool isInCommandOrder() {
    for (size_t i = 0; i < kCommandArray.size(); ++i) {
        if (static_cast<size_t>(kCommandArray[i].command) != i) {
            return false;
        }
    }
    return true;
}
static_assert(isInCommandOrder(),
              "kCommandArray must list every Command in enum order");

}  // namespace

const CommandModule* find(const std::string_view keyword) {
    const auto it = std::ranges::find(kCommandArray, keyword,
                                      &CommandModule::name);
    return it != kCommandArray.end() ? &*it : nullptr;
}

const CommandModule& get(Command cmd) {
    const auto index = static_cast<size_t>(cmd);
    if (index >= kCommandArray.size()) {
        LOG(ERROR) << fmt::format("No module for command {}", cmd);
        throw std::out_of_range("Invalid command");
    }
    return kCommandArray[index];
}

std::string getHelpText() {
    static std::string helptext;
    static std::once_flag once;

    std::call_once(once, [] {
        std::vector<std::string> help;
        help.reserve(kCommandArray.size());
        for (const auto& ent : kCommandArray) {
            help.emplace_back(
                fmt::format("  {:<40}{}", ent.valid_args.usage, ent.description));
        }
        help.emplace_back(fmt::format("  {:<40}{}", "exit | close",
                                      "Leave the assistant"));
        helptext = fmt::format("Commands:\n{}\n", fmt::join(help, "\n"));
    });
    return helptext;
}

}  // namespace CommandHelpers
