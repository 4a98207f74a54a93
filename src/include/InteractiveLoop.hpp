#pragma once

#include <api/CommandDispatcher.hpp>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

struct ParsedInput {
    std::string command;
    CommandArgs args;
};

/**
 * @brief Splits an input line by whitespace into a lowercase command and its
 * arguments.
 *
 * @return std::nullopt if the line holds no tokens.
 */
std::optional<ParsedInput> parseInput(std::string_view line);

// True for "exit" or "close" in any letter case.
bool isExitCommand(std::string_view line);

// Read-eval-print loop over a pair of streams.
class InteractiveLoop {
   public:
    static constexpr std::string_view kGreeting =
        "Welcome to the assistant bot!";
    static constexpr std::string_view kPrompt = "Enter a command: ";
    static constexpr std::string_view kFarewell = "Goodbye!";

    InteractiveLoop(const CommandDispatcher* dispatcher, std::istream& in,
                    std::ostream& out)
        : _dispatcher(dispatcher), _in(in), _out(out) {}

    /**
     * @brief Runs until the exit sentinel or the end of input.
     *
     * @param book The address book the commands operate on.
     * @return Number of commands dispatched.
     */
    size_t run(AddressBook& book);

   private:
    const CommandDispatcher* _dispatcher;
    std::istream& _in;
    std::ostream& _out;
};
