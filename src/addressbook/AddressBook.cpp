#include <AbslLogCompat.hpp>
#include <fmt/format.h>

#include <addressbook/AddressBook.hpp>
#include <utility>

void AddressBook::addRecord(Record record) {
    const std::string& name = record.name().value();
    if (auto it = _index.find(name); it != _index.end()) {
        DLOG(INFO) << "Replacing record of " << name;
        _records[it->second] = std::move(record);
        return;
    }
    _index.emplace(name, _records.size());
    _records.emplace_back(std::move(record));
}

bool AddressBook::contains(const std::string_view name) const {
    return _index.contains(name);
}

Record* AddressBook::find(const std::string_view name) {
    auto it = _index.find(name);
    return it != _index.end() ? &_records[it->second] : nullptr;
}

const Record* AddressBook::find(const std::string_view name) const {
    auto it = _index.find(name);
    return it != _index.end() ? &_records[it->second] : nullptr;
}

std::vector<std::string> AddressBook::getBirthdaysPerWeek(
    const std::chrono::year_month_day today) const {
    using std::chrono::sys_days;

    const sys_days from{today};
    const sys_days until = from + std::chrono::days{kBirthdayLookaheadDays};
    std::vector<std::string> result;

    for (const auto& record : _records) {
        const auto& birthday = record.birthday();
        if (!birthday) {
            continue;
        }
        const auto date = birthday->date();
        const std::chrono::year_month_day candidate{today.year(), date.month(),
                                                    date.day()};
        if (!candidate.ok()) {
            LOG(WARNING) << fmt::format(
                "Birthday {} of {} does not exist in year {}",
                birthday->value(), record.name().value(),
                static_cast<int>(today.year()));
            continue;
        }
        const sys_days when{candidate};
        if (from <= when && when <= until) {
            result.emplace_back(record.name().value());
        }
    }
    return result;
}
