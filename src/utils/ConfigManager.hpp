#pragma once

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "CommandLine.hpp"

// Abstract manager for config loader
// Currently have three sources, cmdline, env and file
class ConfigManager {
   public:
    enum class Configs {
        HELP,
        LOG_FILE,
        LOG_LEVEL,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    /**
     * get - Function used to retrieve the value of a specific
     * configuration.
     *
     * @param config The configuration for which the value is to be retrieved.
     * @return A std::optional containing the value of the specified
     * configuration, or std::nullopt if the configuration is not found.
     */
    std::optional<std::string> get(Configs config) const;

    /**
     * serializeHelpToOStream - Function used to serialize the help information
     * to an output stream.
     *
     * @param out The output stream to which the help information will be
     * serialized.
     */
    static void serializeHelpToOStream(std::ostream& out);

    explicit ConfigManager(CommandLine line);

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Also write logs to this file",
            'f',
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_LEVEL,
            "LOG_LEVEL",
            "Log level (trace/debug/info/warn/error/critical/off)",
            'l',
            Entry::ArgType::STRING,
        },
    };

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;

        /**
         * @brief This field stores the name of the backend.
         *
         * This field stores the name of the backend, such as "Cmdline" or
         * "File". This field is used for logging purposes.
         */
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    enum class BackendType { COMMAND_LINE, ENV, FILE, MAX };

    class BackendStorage {
        std::array<std::unique_ptr<Backend>, static_cast<int>(BackendType::MAX)>
            backends;

       public:
        std::unique_ptr<Backend>& operator[](const BackendType type) {
            return backends[static_cast<int>(type)];
        }

        [[nodiscard]] decltype(backends)::const_iterator begin() const {
            return backends.cbegin();
        }

        [[nodiscard]] decltype(backends)::const_iterator end() const {
            return backends.cend();
        }

        [[nodiscard]] size_t size() const {
            return std::ranges::count_if(
                backends, [](const auto& ent) { return ent != nullptr; });
        }
    } storage;
};
