#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <functional>
#include <gmshim/GraphicsMagick.hpp>
#include <gmshim/PopenCommandRunner.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"
#include "cli/CliOptions.hpp"
#include "logging/SpdlogInit.hpp"

namespace po = boost::program_options;
using namespace gmshim;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct Invocation {
    std::vector<std::string> args;
    Options options;
    Options outputOptions;
};

struct Subcommand {
    std::string_view usage;
    size_t minArgs;
    std::function<int(const GraphicsMagick&, const Invocation&)> run;
};

int report(const CommandResult& result) {
    if (!result) {
        std::cerr << result.error() << std::endl;
        return kExitFailure;
    }
    return kExitOk;
}

int report(const Result<std::string>& result) {
    if (!result) {
        std::cerr << result.error() << std::endl;
        return kExitFailure;
    }
    std::cout << *result;
    return kExitOk;
}

const std::map<std::string_view, Subcommand>& subcommands() {
    static const std::map<std::string_view, Subcommand> kSubcommands = {
        {"version",
         {"version", 0,
          [](const GraphicsMagick& gm, const Invocation&) {
              return report(gm.version());
          }}},
        {"identify",
         {"identify FILE", 1,
          [](const GraphicsMagick& gm, const Invocation& inv) {
              return report(gm.identify(inv.args[0], inv.options));
          }}},
        {"identify-explicit",
         {"identify-explicit FILE FIELD[,FIELD...]", 2,
          [](const GraphicsMagick& gm, const Invocation& inv) {
              const auto fields = cli::parseFieldList(inv.args[1]);
              if (!fields.ok()) {
                  std::cerr << fields.status().message() << std::endl;
                  return kExitUsage;
              }
              const auto record = gm.identifyExplicit(inv.args[0], *fields);
              if (!record) {
                  std::cerr << record.error() << std::endl;
                  return kExitFailure;
              }
              for (const auto& [name, value] : record->fields()) {
                  std::cout << name << ": ";
                  std::visit([](const auto& v) { std::cout << v; }, value);
                  std::cout << std::endl;
              }
              return kExitOk;
          }}},
        {"convert",
         {"convert IN OUT", 2,
          [](const GraphicsMagick& gm, const Invocation& inv) {
              return report(gm.convert(inv.args[0], inv.args[1], inv.options,
                                       inv.outputOptions));
          }}},
        {"mogrify",
         {"mogrify FILE", 1,
          [](const GraphicsMagick& gm, const Invocation& inv) {
              return report(gm.mogrify(inv.args[0], inv.options));
          }}},
        {"composite",
         {"composite IN BASE OUT", 3,
          [](const GraphicsMagick& gm, const Invocation& inv) {
              return report(gm.composite(inv.args[0], inv.args[1],
                                         inv.args[2], inv.options));
          }}},
        {"montage",
         {"montage OUT IN...", 2,
          [](const GraphicsMagick& gm, const Invocation& inv) {
              const std::vector<std::filesystem::path> inputs(
                  inv.args.begin() + 1, inv.args.end());
              return report(gm.montage(inputs, inv.args[0], inv.options));
          }}},
    };
    return kSubcommands;
}

po::options_description subcommandOptions() {
    po::options_description desc("gmshim options");
    desc.add_options()(
        "opt", po::value<std::vector<std::string>>()->composing(),
        "Option passed to gm, as --opt -SWITCH or --opt -SWITCH=ARG")(
        "out-opt", po::value<std::vector<std::string>>()->composing(),
        "Output option for convert, same syntax as --opt")(
        "command", po::value<std::vector<std::string>>(),
        "Subcommand and its arguments");
    return desc;
}

po::options_description cliOptions() {
    auto desc = subcommandOptions();
    // Config entries are read by ConfigManager, they only need to parse here.
    for (const auto& entry : ConfigManager::kConfigMap) {
        const auto name =
            entry.alias != ConfigManager::Entry::ALIAS_NONE
                ? std::string(entry.name) + "," + entry.alias
                : std::string(entry.name);
        if (entry.type == ConfigManager::Entry::ArgType::NONE) {
            desc.add_options()(name.c_str(), entry.description.data());
        } else {
            desc.add_options()(name.c_str(), po::value<std::string>(),
                               entry.description.data());
        }
    }
    return desc;
}

void printUsage(std::ostream& out, const char* exe) {
    out << "Usage: " << exe << " SUBCOMMAND [ARGS] [--opt -SWITCH[=ARG]]..."
        << std::endl
        << "Subcommands:" << std::endl;
    for (const auto& [name, sub] : subcommands()) {
        out << "  " << sub.usage << std::endl;
    }
}

std::vector<std::string> getStrings(const po::variables_map& vm,
                                    const char* name) {
    if (vm.count(name) == 0) {
        return {};
    }
    return vm[name].as<std::vector<std::string>>();
}

}  // namespace

int app_main(int argc, char** argv) {
    CommandLine line(argc, argv);
    ConfigManager config(line);

    if (const auto logFile = config.get(ConfigManager::Configs::LOG_FILE)) {
        GmShim_SpdlogInit(std::filesystem::path(*logFile));
    }

    po::positional_options_description positional;
    positional.add("command", -1);
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(cliOptions())
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << std::endl;
        printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }

    // Only honoured on the command line, not from env or file.
    const auto& help = ConfigManager::entry(ConfigManager::Configs::HELP);
    if (vm.count(std::string(help.name)) != 0) {
        printUsage(std::cout, argv[0]);
        std::cout << subcommandOptions();
        ConfigManager::serializeHelpToOStream(std::cout);
        return kExitOk;
    }

    auto command = getStrings(vm, "command");
    if (command.empty()) {
        printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }
    const auto it = subcommands().find(command.front());
    if (it == subcommands().end()) {
        std::cerr << "Unknown subcommand: " << command.front() << std::endl;
        printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }
    const auto& sub = it->second;

    Invocation invocation;
    invocation.args.assign(command.begin() + 1, command.end());
    if (invocation.args.size() < sub.minArgs) {
        std::cerr << "Usage: " << argv[0] << " " << sub.usage << std::endl;
        return kExitUsage;
    }
    auto options = cli::parseOptionSpecs(getStrings(vm, "opt"));
    auto outputOptions = cli::parseOptionSpecs(getStrings(vm, "out-opt"));
    if (!options.ok() || !outputOptions.ok()) {
        std::cerr << (options.ok() ? outputOptions.status() : options.status())
                         .message()
                  << std::endl;
        return kExitUsage;
    }
    invocation.options = std::move(*options);
    invocation.outputOptions = std::move(*outputOptions);

    GraphicsMagickSettings settings;
    if (const auto binary = config.get(ConfigManager::Configs::GM_BINARY)) {
        settings.binary = *binary;
    }
    if (config.enabled(ConfigManager::Configs::LEGACY_TEMPLATES)) {
        settings.templateMode = TemplateMode::kLegacy;
    }
    DLOG(INFO) << "Using '" << settings.binary << "' for " << command.front();

    const GraphicsMagick gm(std::make_shared<PopenCommandRunner>(),
                            std::move(settings));
    return sub.run(gm, invocation);
}
