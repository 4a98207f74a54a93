#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <addressbook/AddressBook.hpp>
#include <string>
#include <string_view>

#include "api/CommandModule.hpp"
#include "api/Providers.hpp"

// Routes a parsed command to its handler and turns every failure into the
// reply text shown to the user.
class CommandDispatcher {
   public:
    static constexpr std::string_view kInvalidCommand = "Invalid command.";

    explicit CommandDispatcher(const Providers* provider)
        : _provider(provider) {}

    /**
     * @brief Runs one command against the address book.
     *
     * @param book The address book to query or mutate.
     * @param keyword Lowercase command keyword.
     * @param args Positional arguments following the keyword.
     * @return The reply to display. Never fails: validation errors are
     * rendered as their message.
     */
    std::string execute(AddressBook& book, std::string_view keyword,
                        const CommandArgs& args) const;

    /**
     * @brief Runs one command, keeping failures as a status.
     *
     * @return The handler reply, InvalidArgument for missing or extra
     * arguments and field validation failures, or NotFound for an unknown
     * keyword.
     */
    absl::StatusOr<std::string> dispatch(AddressBook& book,
                                         std::string_view keyword,
                                         const CommandArgs& args) const;

   private:
    static absl::Status validateValidArgs(const CommandModule* module,
                                          const CommandArgs& args);

    const Providers* _provider;
};
