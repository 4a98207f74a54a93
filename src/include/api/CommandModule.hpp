#pragma once

#include <absl/status/statusor.h>
#include <fmt/format.h>

#include <addressbook/AddressBook.hpp>
#include <string>
#include <string_view>
#include <vector>

#include "api/Providers.hpp"

using CommandArgs = std::vector<std::string>;

// Command handler helper macros
#define COMMAND_HANDLER_NAME(cmd) handle_command_##cmd
#define DECLARE_COMMAND_HANDLER(cmd)                                    \
    absl::StatusOr<std::string> COMMAND_HANDLER_NAME(cmd)(              \
        [[maybe_unused]] AddressBook & book,                            \
        [[maybe_unused]] const CommandArgs& args,                       \
        [[maybe_unused]] const Providers* provider)

enum class Command {
    kAdd,
    kChange,
    kPhone,
    kAll,
    kAddBirthday,
    kShowBirthday,
    kBirthdays,
    kHello,
    kMax
};

struct CommandModule {
    using command_callback_t = absl::StatusOr<std::string> (*)(
        AddressBook& book, const CommandArgs& args, const Providers* provider);

    struct ValidArgs {
        static constexpr int kUnlimited = -1;

        // Fewer arguments than this is a missing argument.
        int min;
        // More arguments than this is rejected, unless kUnlimited.
        int max;
        // Reply when arguments are missing.
        std::string_view missing;
        // Usage information for the command.
        std::string_view usage;
    };

    Command command;
    std::string_view name;
    std::string_view description;
    command_callback_t function;
    ValidArgs valid_args;
};

template <>
struct fmt::formatter<Command> : formatter<std::string_view> {
    // parse is inherited from formatter<string_view>.
    auto format(Command c, format_context& ctx) const
        -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
#define DEFINE_STR(x) \
    case Command::x:  \
        name = #x;    \
        break
            DEFINE_STR(kAdd);
            DEFINE_STR(kChange);
            DEFINE_STR(kPhone);
            DEFINE_STR(kAll);
            DEFINE_STR(kAddBirthday);
            DEFINE_STR(kShowBirthday);
            DEFINE_STR(kBirthdays);
            DEFINE_STR(kHello);
#undef DEFINE_STR
            default:
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

namespace CommandHelpers {

/**
 * @brief Find the module bound to a command keyword.
 *
 * @param keyword Lowercase command keyword, e.g. "add-birthday"
 * @return the module, or nullptr if the keyword is not a command
 */
const CommandModule* find(std::string_view keyword);

/**
 * @brief Get the module of a Command
 *
 * @param cmd Command to get the module of, must not be kMax
 * @return the module bound to cmd
 */
const CommandModule& get(Command cmd);

/**
 * @brief Get the help text listing every command and its usage
 */
std::string getHelpText();

}  // namespace CommandHelpers
