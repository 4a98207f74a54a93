#include <AbslLogCompat.hpp>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_split.h>

#include <InteractiveLoop.hpp>
#include <iterator>
#include <string>
#include <vector>

std::optional<ParsedInput> parseInput(const std::string_view line) {
    std::vector<std::string> tokens =
        absl::StrSplit(line, absl::ByAnyChar(" \t\r\n\v\f"), absl::SkipEmpty());
    if (tokens.empty()) {
        return std::nullopt;
    }
    ParsedInput parsed;
    parsed.command = absl::AsciiStrToLower(tokens.front());
    parsed.args.assign(std::make_move_iterator(tokens.begin() + 1),
                       std::make_move_iterator(tokens.end()));
    return parsed;
}

bool isExitCommand(const std::string_view line) {
    const auto stripped = absl::StripAsciiWhitespace(line);
    return absl::EqualsIgnoreCase(stripped, "exit") ||
           absl::EqualsIgnoreCase(stripped, "close");
}

size_t InteractiveLoop::run(AddressBook& book) {
    size_t dispatched = 0;
    std::string line;

    _out << kGreeting << std::endl;
    while (true) {
        _out << kPrompt << std::flush;
        if (!std::getline(_in, line)) {
            LOG(INFO) << "End of input";
            _out << std::endl << kFarewell << std::endl;
            break;
        }
        if (isExitCommand(line)) {
            _out << kFarewell << std::endl;
            break;
        }
        auto parsed = parseInput(line);
        if (!parsed) {
            continue;
        }
        _out << _dispatcher->execute(book, parsed->command, parsed->args)
             << std::endl;
        ++dispatched;
    }
    return dispatched;
}
