#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

#include <addressbook/Field.hpp>
#include <algorithm>
#include <array>
#include <vector>

namespace {

bool isAllDigits(const std::string_view value) {
    return std::ranges::all_of(
        value, [](const char c) { return absl::ascii_isdigit(c); });
}

}  // namespace

absl::StatusOr<Name> Name::create(std::string value) {
    if (value.empty()) {
        return absl::InvalidArgumentError("Name must not be empty");
    }
    return Name(std::move(value));
}

bool Phone::validate(const std::string_view value) {
    return value.size() == kDigits && isAllDigits(value);
}

absl::StatusOr<Phone> Phone::create(std::string value) {
    if (!validate(value)) {
        return absl::InvalidArgumentError("Phone number must be 10 digits");
    }
    return Phone(std::move(value));
}

std::optional<std::chrono::year_month_day> Birthday::parse(
    const std::string_view value) {
    constexpr std::array<size_t, 3> kPartWidths = {2, 2, 4};

    const std::vector<std::string_view> parts = absl::StrSplit(value, '.');
    if (parts.size() != kPartWidths.size()) {
        return std::nullopt;
    }
    std::array<int, 3> numbers{};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].size() != kPartWidths[i] || !isAllDigits(parts[i])) {
            return std::nullopt;
        }
        if (!absl::SimpleAtoi(parts[i], &numbers[i])) {
            return std::nullopt;
        }
    }
    const auto [d, m, y] = numbers;
    // There is no year zero in the calendar we accept.
    if (y < 1) {
        return std::nullopt;
    }
    const std::chrono::year_month_day date{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned int>(m)},
        std::chrono::day{static_cast<unsigned int>(d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

absl::StatusOr<Birthday> Birthday::create(std::string value) {
    const auto date = parse(value);
    if (!date) {
        return absl::InvalidArgumentError(
            "Birthday must be in DD.MM.YYYY format");
    }
    return Birthday(std::move(value), *date);
}
