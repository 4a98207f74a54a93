#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

// A validated scalar value of a contact.
class Field {
   public:
    [[nodiscard]] const std::string& value() const { return _value; }

    bool operator==(const std::string_view other) const {
        return _value == other;
    }

   protected:
    explicit Field(std::string value) : _value(std::move(value)) {}

   private:
    std::string _value;
};

inline std::ostream& operator<<(std::ostream& os, const Field& field) {
    return os << field.value();
}

class Name : public Field {
   public:
    /**
     * @brief Creates a contact name.
     *
     * @param value The name, must not be empty.
     * @return The name, or InvalidArgument if the value is empty.
     */
    static absl::StatusOr<Name> create(std::string value);

   private:
    using Field::Field;
};

class Phone : public Field {
   public:
    static constexpr size_t kDigits = 10;

    /**
     * @brief Checks that the value is exactly kDigits decimal digits.
     */
    static bool validate(std::string_view value);

    /**
     * @brief Creates a phone number.
     *
     * @param value Exactly 10 decimal digits.
     * @return The phone, or InvalidArgument with the user visible reason.
     */
    static absl::StatusOr<Phone> create(std::string value);

   private:
    using Field::Field;
};

class Birthday : public Field {
   public:
    /**
     * @brief Parses a DD.MM.YYYY string into a calendar date.
     *
     * Only the exact two digit day, two digit month and four digit year
     * layout is accepted, and the date must exist in the Gregorian calendar.
     *
     * @param value The text to parse.
     * @return The parsed date, or std::nullopt if it is not a valid date.
     */
    static std::optional<std::chrono::year_month_day> parse(
        std::string_view value);

    static bool validate(std::string_view value) {
        return parse(value).has_value();
    }

    /**
     * @brief Creates a birthday from its DD.MM.YYYY text.
     *
     * @return The birthday, or InvalidArgument with the user visible reason.
     */
    static absl::StatusOr<Birthday> create(std::string value);

    [[nodiscard]] std::chrono::year_month_day date() const { return _date; }

   private:
    Birthday(std::string value, std::chrono::year_month_day date)
        : Field(std::move(value)), _date(date) {}

    std::chrono::year_month_day _date;
};
