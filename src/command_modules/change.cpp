#include "CommandModule.h"

DECLARE_COMMAND_HANDLER(change) {
    auto* record = book.find(args[0]);
    if (record == nullptr) {
        return "Contact not found.";
    }
    const auto edited = record->editPhone(args[1], args[2]);
    if (!edited.ok()) {
        return edited.status();
    }
    if (!*edited) {
        return "Old phone number not found.";
    }
    return "Contact phone updated.";
}
