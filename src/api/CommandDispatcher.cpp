#include <AbslLogCompat.hpp>
#include <fmt/format.h>

#include <api/CommandDispatcher.hpp>
#include <string>
#include <utility>

absl::Status CommandDispatcher::validateValidArgs(const CommandModule* module,
                                                  const CommandArgs& args) {
    const auto& valid = module->valid_args;
    const int in_args_size = static_cast<int>(args.size());

    if (in_args_size < valid.min) {
        return absl::InvalidArgumentError(valid.missing);
    }
    if (valid.max != CommandModule::ValidArgs::kUnlimited &&
        in_args_size > valid.max) {
        return absl::InvalidArgumentError(fmt::format(
            "Error: Too many arguments. Usage: {}", valid.usage));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::string> CommandDispatcher::dispatch(
    AddressBook& book, const std::string_view keyword,
    const CommandArgs& args) const {
    const auto* module = CommandHelpers::find(keyword);
    if (module == nullptr) {
        DLOG(INFO) << "Unknown command: " << keyword;
        return absl::NotFoundError(kInvalidCommand);
    }

    // Partial offloading to common code.
    if (auto status = validateValidArgs(module, args); !status.ok()) {
        return status;
    }

    DLOG(INFO) << fmt::format("Executing {} with {} args", module->command,
                              args.size());
    return module->function(book, args, _provider);
}

std::string CommandDispatcher::execute(AddressBook& book,
                                       const std::string_view keyword,
                                       const CommandArgs& args) const {
    auto result = dispatch(book, keyword, args);
    if (!result.ok()) {
        LOG(INFO) << fmt::format("Command '{}' failed: {}", keyword,
                                 result.status().ToString());
        return std::string(result.status().message());
    }
    return *std::move(result);
}
