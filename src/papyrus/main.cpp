// EN: papyrus command line: builds a site or prints the engine version.
// FR: Ligne de commande papyrus : construit un site ou affiche la version du moteur.

#include "infrastructure/config/site_config.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/builder.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "Usage: papyrus COMMAND [OPTIONS] [SOURCE] [DESTINATION]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  build     Build the site" << std::endl;
    std::cout << "  version   Print the engine version" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE     Site configuration (default: SOURCE/papyrus.yml)" << std::endl;
    std::cout << "  --drafts          Include pages marked as draft" << std::endl;
    std::cout << "  --dry-run         Run every step without writing output" << std::endl;
    std::cout << "  --page PATH       Build a single page" << std::endl;
    std::cout << "  --baseurl URL     Override the configured base URL" << std::endl;
    std::cout << "  --log-file FILE   Write NDJSON logs to FILE" << std::endl;
    std::cout << "  -v, --verbose     Show step details" << std::endl;
    std::cout << "  -vv, --debug      Show debug messages" << std::endl;
    std::cout << "  -q, --quiet       Only show errors" << std::endl;
}

struct CommandLine {
    std::string command;
    std::optional<std::filesystem::path> source;
    std::optional<std::filesystem::path> destination;
    std::optional<std::string> config_file;
    std::optional<std::string> baseurl;
    std::optional<std::string> log_file;
    PSB::Verbosity verbosity = PSB::Verbosity::NORMAL;
    PSB::Orchestrator::BuildOptionMap options;
};

// EN: Returns nullopt and prints the reason on invalid arguments.
// FR: Retourne nullopt et affiche la raison si les arguments sont invalides.
std::optional<CommandLine> parseArguments(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next = [&](const std::string& option) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--drafts") {
            cli.options[PSB::Orchestrator::BuildOptions::kDrafts] = true;
        } else if (arg == "--dry-run") {
            cli.options[PSB::Orchestrator::BuildOptions::kDryRun] = true;
        } else if (arg == "--page" || arg == "--config" || arg == "--baseurl" || arg == "--log-file") {
            auto value = next(arg);
            if (!value) {
                return std::nullopt;
            }
            if (arg == "--page") cli.options[PSB::Orchestrator::BuildOptions::kPage] = *value;
            else if (arg == "--config") cli.config_file = *value;
            else if (arg == "--baseurl") cli.baseurl = *value;
            else cli.log_file = *value;
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbosity = PSB::Verbosity::VERBOSE;
        } else if (arg == "-vv" || arg == "--debug") {
            cli.verbosity = PSB::Verbosity::DEBUG;
        } else if (arg == "-q" || arg == "--quiet") {
            cli.verbosity = PSB::Verbosity::QUIET;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        std::cerr << "Missing command" << std::endl;
        return std::nullopt;
    }
    cli.command = positional[0];
    if (positional.size() > 1) cli.source = positional[1];
    if (positional.size() > 2) cli.destination = positional[2];
    if (positional.size() > 3) {
        std::cerr << "Too many arguments" << std::endl;
        return std::nullopt;
    }
    return cli;
}

int runBuild(const CommandLine& cli) {
    auto& logger = PSB::Logger::getInstance();
    logger.setVerbosity(cli.verbosity);
    if (cli.log_file) {
        logger.setOutputFile(*cli.log_file);
    }
    logger.setCorrelationId(logger.generateCorrelationId());

    auto config = std::make_shared<PSB::SiteConfig>();
    config->setSourceDir(cli.source);
    config->setDestinationDir(cli.destination);

    const std::filesystem::path config_file = cli.config_file
        ? std::filesystem::path(*cli.config_file)
        : config->getSourceDir() / "papyrus.yml";
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        if (!config->loadFromFile(config_file.string())) {
            return 1;
        }
    } else if (cli.config_file) {
        LOG_ERROR("cli", "Configuration file not found: " + config_file.string());
        return 1;
    }
    config->loadEnvironmentOverrides();
    if (cli.baseurl) {
        config->set("baseurl", *cli.baseurl);
    }

    // EN: The builder shares the process-wide logger; it does not own it.
    // FR: Le builder partage le logger global ; il n'en est pas propriétaire.
    std::shared_ptr<PSB::Logger> shared_logger(&logger, [](PSB::Logger*) {});

    try {
        PSB::Orchestrator::Builder builder(config, shared_logger);
        builder.build(cli.options);
    } catch (const PSB::StepFailure& e) {
        std::cerr << "Build failed at step '" << e.stepName() << "': " << e.cause() << std::endl;
        return 2;
    } catch (const PSB::BuildError& e) {
        std::cerr << "Build failed: " << e.what() << std::endl;
        return 2;
    }

    logger.flush();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 1) {
        const std::string arg = argv[1];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (arg == "--version") {
            std::cout << PSB::Orchestrator::Builder::getVersion() << std::endl;
            return 0;
        }
    }

    auto cli = parseArguments(argc, argv);
    if (!cli) {
        printUsage();
        return 64;
    }

    if (cli->command == "version") {
        std::cout << "Papyrus " << PSB::Orchestrator::Builder::getVersion() << std::endl;
        return 0;
    }
    if (cli->command == "build") {
        return runBuild(*cli);
    }

    std::cerr << "Unknown command: " << cli->command << std::endl;
    printUsage();
    return 64;
}
