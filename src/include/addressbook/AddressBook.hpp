#pragma once

#include <absl/container/flat_hash_map.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "Record.hpp"

// All contacts, keyed by name. Iteration follows insertion order.
class AddressBook {
   public:
    // Days after today still reported by getBirthdaysPerWeek().
    static constexpr int kBirthdayLookaheadDays = 7;

    using const_iterator = std::vector<Record>::const_iterator;

    AddressBook() = default;

    /**
     * @brief Inserts a record, replacing any record with the same name.
     *
     * A replaced record keeps its position in iteration order.
     */
    void addRecord(Record record);

    [[nodiscard]] bool contains(std::string_view name) const;

    /**
     * @brief Looks up a record by name.
     *
     * @return The record, or nullptr if there is no contact with this name.
     */
    [[nodiscard]] Record* find(std::string_view name);
    [[nodiscard]] const Record* find(std::string_view name) const;

    /**
     * @brief Names of contacts whose birthday, moved to today's year, falls
     * within [today, today + kBirthdayLookaheadDays].
     *
     * Birthdays are not rolled over into the next year, and a 29 February
     * birthday is skipped when today's year is not a leap year.
     *
     * @param today The current local date.
     * @return Matching names in insertion order.
     */
    [[nodiscard]] std::vector<std::string> getBirthdaysPerWeek(
        std::chrono::year_month_day today) const;

    [[nodiscard]] size_t size() const { return _records.size(); }
    [[nodiscard]] bool empty() const { return _records.empty(); }
    [[nodiscard]] const_iterator begin() const { return _records.cbegin(); }
    [[nodiscard]] const_iterator end() const { return _records.cend(); }

   private:
    std::vector<Record> _records;
    absl::flat_hash_map<std::string, size_t> _index;
};
