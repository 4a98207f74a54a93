#include "CommandModule.h"

DECLARE_COMMAND_HANDLER(phone) {
    const auto* record = book.find(args.front());
    if (record == nullptr) {
        return "Contact not found.";
    }
    return record->toString();
}
