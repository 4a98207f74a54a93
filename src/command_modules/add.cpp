#include <AbslLogCompat.hpp>

#include <utility>

#include "CommandModule.h"

DECLARE_COMMAND_HANDLER(add) {
    const auto& name = args[0];
    const auto& phone = args[1];

    if (auto* record = book.find(name); record != nullptr) {
        if (auto status = record->addPhone(phone); !status.ok()) {
            return status;
        }
        return "Phone number added to the existing contact.";
    }

    auto record = Record::create(name);
    if (!record.ok()) {
        return record.status();
    }
    if (auto status = record->addPhone(phone); !status.ok()) {
        return status;
    }
    book.addRecord(*std::move(record));
    DLOG(INFO) << "Created contact " << name;
    return "Contact added.";
}
