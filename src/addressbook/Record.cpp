#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include <addressbook/Record.hpp>
#include <algorithm>
#include <utility>

absl::StatusOr<Record> Record::create(std::string name,
                                      std::optional<std::string> birthday) {
    auto validName = Name::create(std::move(name));
    if (!validName.ok()) {
        return validName.status();
    }
    Record record(*std::move(validName));
    if (birthday) {
        if (auto status = record.addBirthday(std::move(*birthday));
            !status.ok()) {
            return status;
        }
    }
    return record;
}

absl::Status Record::addPhone(std::string value) {
    auto phone = Phone::create(std::move(value));
    if (!phone.ok()) {
        return phone.status();
    }
    _phones.emplace_back(*std::move(phone));
    return absl::OkStatus();
}

void Record::removePhone(const std::string_view value) {
    std::erase_if(_phones, [value](const Phone& phone) { return phone == value; });
}

absl::StatusOr<bool> Record::editPhone(const std::string_view oldValue,
                                       std::string newValue) {
    auto it = std::ranges::find_if(
        _phones, [oldValue](const Phone& phone) { return phone == oldValue; });
    if (it == _phones.end()) {
        return false;
    }
    auto phone = Phone::create(std::move(newValue));
    if (!phone.ok()) {
        return phone.status();
    }
    *it = *std::move(phone);
    return true;
}

absl::Status Record::addBirthday(std::string value) {
    auto birthday = Birthday::create(std::move(value));
    if (!birthday.ok()) {
        return birthday.status();
    }
    _birthday = *std::move(birthday);
    return absl::OkStatus();
}

const Phone* Record::findPhone(const std::string_view value) const {
    auto it = std::ranges::find_if(
        _phones, [value](const Phone& phone) { return phone == value; });
    return it != _phones.end() ? &*it : nullptr;
}

std::string Record::toString() const {
    std::string result = fmt::format(
        "Contact name: {}, phones: {}", _name.value(),
        absl::StrJoin(_phones, ", ", [](std::string* out, const Phone& phone) {
            out->append(phone.value());
        }));
    if (_birthday) {
        result += fmt::format(", birthday: {}", _birthday->value());
    }
    return result;
}
