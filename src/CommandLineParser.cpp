#include "CommandLineParser.hpp"
#include "LedgerConfig.hpp"
#include <sstream>

namespace ledger {

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'ledger help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Глобальный help
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    result.command = "help";
                    for (int j = 2; j < argc; ++j) {
                        if (argv[j][0] != '-') {
                            result.positional.push_back(argv[j]);
                        }
                    }
                } else {
                    // ledger migrate --help -> справка по migrate
                    result.positional.push_back(result.command);
                    result.command = "help";
                }
                return result;
            }
        }

        std::vector<std::string> args(argv + 2, argv + argc);

        if (result.command == "migrate") {
            auto desc = createMigrateOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "bootstrap") {
            auto desc = createBootstrapOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);

            // Файл конфигурации дополняет командную строку
            if (result.options.count("config")) {
                auto merged = LedgerConfig::mergeConfigFile(
                    result.options["config"].as<std::string>(), result.options);
                if (!merged) {
                    return std::unexpected(merged.error().message);
                }
            }
            po::notify(result.options);

        } else {
            std::ostringstream oss;
            oss << "Unknown command: " << result.command;
            return std::unexpected(oss.str());
        }

        return result;

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") +
                               e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Опции команд
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createMigrateOptions() {
    po::options_description desc("Migrate options");

    desc.add_options()
        ("json-path", po::value<std::string>()->required(),
         "Source JSON document")

        ("sqlite-path", po::value<std::string>()->required(),
         "Target SQLite database")

        ("schema-path", po::value<std::string>()->default_value("db/schema.sql"),
         "SQL schema script")

        ("base-currency", po::value<std::string>()->default_value("KZT"),
         "Base currency code")

        ("dry-run", po::bool_switch()->default_value(false),
         "Validate source and schema without writing");

    return desc;
}

po::options_description CommandLineParser::createBootstrapOptions() {
    po::options_description desc("Bootstrap options");

    desc.add_options()
        ("config,c", po::value<std::string>(),
         "INI-style configuration file");

    desc.add(LedgerConfig::createConfigOptions());
    return desc;
}

}  // namespace ledger
