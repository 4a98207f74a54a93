#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Field.hpp"

// One contact: a name, its phone numbers in insertion order and an optional
// birthday.
class Record {
   public:
    explicit Record(Name name) : _name(std::move(name)) {}

    /**
     * @brief Creates a record with the given name and optional birthday.
     *
     * @param name The contact name.
     * @param birthday Birthday in DD.MM.YYYY, if known.
     * @return The record, or InvalidArgument if a field fails validation.
     */
    static absl::StatusOr<Record> create(
        std::string name, std::optional<std::string> birthday = std::nullopt);

    /**
     * @brief Appends a phone number. Duplicates are kept.
     *
     * @return InvalidArgument if the value is not a valid phone number.
     */
    absl::Status addPhone(std::string value);

    // Removes every phone equal to value. Removing nothing is not an error.
    void removePhone(std::string_view value);

    /**
     * @brief Replaces the first phone equal to oldValue with newValue.
     *
     * @return false if no phone equals oldValue, true once replaced, or
     * InvalidArgument if newValue is not a valid phone number. The record is
     * left untouched on failure.
     */
    absl::StatusOr<bool> editPhone(std::string_view oldValue,
                                   std::string newValue);

    // Sets or overwrites the birthday.
    absl::Status addBirthday(std::string value);

    [[nodiscard]] const Phone* findPhone(std::string_view value) const;

    [[nodiscard]] const Name& name() const { return _name; }
    [[nodiscard]] const std::vector<Phone>& phones() const { return _phones; }
    [[nodiscard]] const std::optional<Birthday>& birthday() const {
        return _birthday;
    }

    // "Contact name: {name}, phones: {a, b}[, birthday: {DD.MM.YYYY}]"
    [[nodiscard]] std::string toString() const;

   private:
    Name _name;
    std::vector<Phone> _phones;
    std::optional<Birthday> _birthday;
};

inline std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << record.toString();
}
