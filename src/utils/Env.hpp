#pragma once

#include <optional>
#include <string>
#include <string_view>

// A C++-like interface for reading and changing environment variables.
class Env {
   public:
    Env() = default;

    class ValueEntry {
        std::string _key;

       public:
        explicit ValueEntry(const std::string_view key) : _key(key) {}
        // Aka, setenv
        const Env::ValueEntry& operator=(std::string_view value) const;
        // Aka, unsetenv
        void clear() const;
        // Aka, getenv
        [[nodiscard]] std::optional<std::string> get() const;

        [[nodiscard]] bool has() const { return get().has_value(); }
        [[nodiscard]] std::string_view key() const { return _key; }

        ValueEntry() = delete;
        ~ValueEntry() = default;
    };

    ValueEntry operator[](const std::string_view key) const {
        return ValueEntry{key};
    }
};
