#include <absl/strings/ascii.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <algorithm>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "CommandLine.hpp"
#include "Env.hpp"

namespace po = boost::program_options;

namespace {

void AddOption(po::options_description &desc,
               const ConfigManager::Entry &entry) {
    const auto name =
        entry.alias != ConfigManager::Entry::ALIAS_NONE
            ? fmt::format("{},{}", entry.name, entry.alias)
            : std::string(entry.name);
    if (entry.type == ConfigManager::Entry::ArgType::NONE) {
        desc.add_options()(name.c_str(), entry.description.data());
    } else {
        desc.add_options()(name.c_str(), po::value<std::string>(),
                           entry.description.data());
    }
}

template <ConfigManager::Configs config>
consteval bool verifyUniqueConfig() {
    return std::ranges::count_if(ConfigManager::kConfigMap,
                                 [](const auto &entry) {
                                     return entry.config == config;
                                 }) == 1;
}

template <size_t... index>
consteval bool verifyAll(const std::index_sequence<index...> /*unused*/) {
    return (verifyUniqueConfig<static_cast<ConfigManager::Configs>(index)>() &&
            ...);
}

static_assert(verifyAll(std::make_index_sequence<ConfigManager::CONFIG_MAX>()),
              "kConfigMap must and only contain one of each configs");

}  // namespace

struct ConfigBackendEnv : public ConfigManager::Backend {
    ~ConfigBackendEnv() override = default;
    ConfigBackendEnv() = default;

    std::optional<std::string> get(const ConfigManager::Entry &entry) override {
        return Env()[entry.name].find();
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

struct ConfigBackendBoostPOBase : public ConfigManager::Backend {
    static po::options_description getOptionsDesc() {
        po::options_description desc("GmShim Configs");
        for (const auto &entry : ConfigManager::kConfigMap) {
            AddOption(desc, entry);
        }
        return desc;
    }

    std::optional<std::string> get(const ConfigManager::Entry &entry) override {
        const auto it = mp.find(std::string(entry.name));
        if (it == mp.end()) {
            return std::nullopt;
        }
        if (entry.type == ConfigManager::Entry::ArgType::NONE) {
            return "true";
        }
        return it->second.as<std::string>();
    }

    ConfigBackendBoostPOBase() = default;
    ~ConfigBackendBoostPOBase() override = default;

   protected:
    po::variables_map mp;
};

struct ConfigBackendFile : public ConfigBackendBoostPOBase {
    static constexpr const char *kConfigFile = ".gmshim.ini";

    bool load() override {
        Env env;
        std::string home;

        if (!env["HOME"].assign(home)) {
            LOG(WARNING) << "HOME is not set, skipping config file";
            return false;
        }

        const auto confPath = std::filesystem::path(home) / kConfigFile;
        std::ifstream ifs(confPath);
        if (ifs.fail()) {
            DLOG(INFO) << "Opening " << confPath << " failed";
            return false;
        }
        try {
            po::store(po::parse_config_file(ifs, getOptionsDesc()), mp);
        } catch (const boost::program_options::error &e) {
            LOG(ERROR) << "File backend failed to parse: " << e.what();
            return false;
        }
        po::notify(mp);

        LOG(INFO) << "Loaded " << mp.size() << " entries from " << confPath;
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "File"; }

    ConfigBackendFile() = default;
    ~ConfigBackendFile() override = default;
};

struct ConfigBackendCmdline : public ConfigBackendBoostPOBase {
    CommandLine _line;

    bool load() override {
        try {
            // Subcommands and their arguments belong to the caller. Without
            // short options "--opt -flip" is never read as -f lip.
            po::store(po::command_line_parser(_line.argc(), _line.argv())
                          .options(getOptionsDesc())
                          .style(po::command_line_style::unix_style ^
                                 po::command_line_style::allow_short)
                          .allow_unregistered()
                          .run(),
                      mp);
        } catch (const boost::program_options::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            return false;
        }
        po::notify(mp);

        DLOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(std::move(line)) {}
    ~ConfigBackendCmdline() override = default;
};

ConfigManager::ConfigManager(CommandLine line) {
    std::unique_ptr<Backend> backends[] = {
        std::make_unique<ConfigBackendCmdline>(std::move(line)),
        std::make_unique<ConfigBackendEnv>(),
        std::make_unique<ConfigBackendFile>(),
    };
    for (auto &backend : backends) {
        if (backend->load()) {
            _backends.emplace_back(std::move(backend));
        }
    }
    DLOG(INFO) << "Loaded " << _backends.size() << " config sources";
}

ConfigManager::~ConfigManager() = default;

const ConfigManager::Entry &ConfigManager::entry(Configs config) {
    return *std::ranges::find_if(
        kConfigMap, [config](const Entry &e) { return e.config == config; });
}

std::optional<std::string> ConfigManager::get(Configs config) {
    const auto &e = entry(config);
    for (const auto &backend : _backends) {
        if (auto value = backend->get(e); value) {
            DLOG(INFO) << "Config " << e.name << " from " << backend->name();
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::enabled(Configs config) {
    const auto value = get(config);
    if (!value) {
        return false;
    }
    const auto lowered = absl::AsciiStrToLower(*value);
    return lowered != "0" && lowered != "false";
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << ConfigBackendBoostPOBase::getOptionsDesc();
    out << "Every option can also be given as an environment variable or "
           "in ~/"
        << ConfigBackendFile::kConfigFile << std::endl;
}
