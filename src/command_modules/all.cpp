#include <absl/strings/str_join.h>

#include "CommandModule.h"

DECLARE_COMMAND_HANDLER(all) {
    if (book.empty()) {
        return "No contacts saved.";
    }
    return absl::StrJoin(book, "\n", [](std::string* out, const Record& record) {
        out->append(record.toString());
    });
}
