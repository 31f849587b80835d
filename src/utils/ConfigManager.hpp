#pragma once

#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"

// GmShim settings, looked up on the command line (--GM_BINARY=...), then in
// the environment, then in ~/.gmshim.ini.
class ConfigManager {
   public:
    enum class Configs {
        GM_BINARY,
        LOG_FILE,
        LEGACY_TEMPLATES,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        // Long option, environment variable and INI key at once.
        std::string_view name;
        std::string_view description;
        // Short option, read by main's parser only
        char alias;
        // NONE entries are switches without a value.
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::GM_BINARY,
            "GM_BINARY",
            "GraphicsMagick binary to run (default: gm)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Also write the log to this file",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::LEGACY_TEMPLATES,
            "LEGACY_TEMPLATES",
            "true: leave unbound template placeholders in the command",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
    };

    // One source of settings.
    struct Backend {
        virtual ~Backend() = default;

        // False if the source is unusable, it is then dropped.
        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const Entry& entry) = 0;
        // For logging
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

    explicit ConfigManager(CommandLine line);
    ~ConfigManager();

    /**
     * @brief Value of a setting from the first source that has it.
     *
     * A switch (ArgType::NONE) reads as "true" when present.
     *
     * @return The value, or std::nullopt if no source sets it.
     */
    std::optional<std::string> get(Configs config);

    // True if the config is present and not set to "0" or "false".
    bool enabled(Configs config);

    static const Entry& entry(Configs config);

    // Prints every setting with its description, for --HELP.
    static void serializeHelpToOStream(std::ostream& out);

   private:
    // Loaded sources, highest priority first.
    std::vector<std::unique_ptr<Backend>> _backends;
};
