#include "LedgerConfig.hpp"
#include "Money.hpp"
#include <fstream>

namespace ledger {

po::options_description LedgerConfig::createConfigOptions() {
    po::options_description desc("Storage options");

    desc.add_options()
        ("use-sqlite", po::value<bool>()->default_value(true),
         "Use SQLite as the active storage (0 - JSON file only)")

        ("json-path", po::value<std::string>()->default_value("data.json"),
         "JSON document path")

        ("sqlite-path", po::value<std::string>()->default_value("finance.db"),
         "SQLite database path")

        ("schema-path", po::value<std::string>()->default_value("db/schema.sql"),
         "SQL schema script used by the migration")

        ("base-currency", po::value<std::string>()->default_value("KZT"),
         "Base currency code")

        ("max-import-rows", po::value<std::size_t>()->default_value(kDefaultMaxImportRows),
         "Maximum number of rows accepted by a single import")

        ("backup", po::value<bool>()->default_value(true),
         "Create a JSON backup before switching to SQLite");

    return desc;
}

Expected<LedgerConfig> LedgerConfig::fromOptions(const po::variables_map& vm) {
    LedgerConfig config;

    try {
        if (vm.count("use-sqlite")) {
            config.useSqlite = vm["use-sqlite"].as<bool>();
        }
        if (vm.count("json-path")) {
            config.jsonPath = vm["json-path"].as<std::string>();
        }
        if (vm.count("sqlite-path")) {
            config.sqlitePath = vm["sqlite-path"].as<std::string>();
        }
        if (vm.count("schema-path")) {
            config.schemaPath = vm["schema-path"].as<std::string>();
        }
        if (vm.count("base-currency")) {
            auto currency = normalizeCurrency(vm["base-currency"].as<std::string>());
            if (!currency) {
                return std::unexpected(currency.error());
            }
            config.baseCurrency = *currency;
        }
        if (vm.count("max-import-rows")) {
            config.maxImportRows = vm["max-import-rows"].as<std::size_t>();
        }
        if (vm.count("backup")) {
            config.backupEnabled = vm["backup"].as<bool>();
        }
    } catch (const boost::bad_any_cast& e) {
        return makeError(ErrorKind::Validation,
            std::string("Invalid configuration value: ") + e.what());
    }

    if (config.maxImportRows == 0) {
        return makeError(ErrorKind::Validation, "max-import-rows must be positive");
    }
    if (config.jsonPath.empty()) {
        return makeError(ErrorKind::Validation, "json-path cannot be empty");
    }
    if (config.useSqlite && config.sqlitePath.empty()) {
        return makeError(ErrorKind::Validation, "sqlite-path cannot be empty");
    }

    return config;
}

Result LedgerConfig::mergeConfigFile(const std::filesystem::path& configPath, po::variables_map& vm) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return makeError(ErrorKind::Validation,
            "Config file not found: " + configPath.string());
    }

    try {
        po::store(po::parse_config_file(file, createConfigOptions()), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return makeError(ErrorKind::Validation,
            "Config file " + configPath.string() + ": " + e.what());
    }
    return {};
}

} // namespace ledger
