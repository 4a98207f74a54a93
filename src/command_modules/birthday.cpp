#include <AbslLogCompat.hpp>
#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include "CommandModule.h"

DECLARE_COMMAND_HANDLER(add_birthday) {
    auto* record = book.find(args[0]);
    if (record == nullptr) {
        return "Contact not found.";
    }
    if (auto status = record->addBirthday(args[1]); !status.ok()) {
        return status;
    }
    return "Birthday added to the contact.";
}

// Missing contact and missing birthday share one reply.
DECLARE_COMMAND_HANDLER(show_birthday) {
    const auto& name = args.front();
    const auto* record = book.find(name);
    if (record == nullptr || !record->birthday()) {
        return "Birthday not found for this contact.";
    }
    return fmt::format("Birthday of {}: {}", name, record->birthday()->value());
}

DECLARE_COMMAND_HANDLER(birthdays) {
    const auto today = provider->clock->today();
    const auto names = book.getBirthdaysPerWeek(today);
    DLOG(INFO) << fmt::format("{} birthdays within {} days", names.size(),
                              AddressBook::kBirthdayLookaheadDays);
    if (names.empty()) {
        return "No birthdays next week.";
    }
    return fmt::format("Birthdays next week:\n{}", absl::StrJoin(names, "\n"));
}
