// include/LedgerConfig.hpp
#pragma once

#include "ImportBatch.hpp"
#include "LedgerError.hpp"
#include <boost/program_options.hpp>
#include <cstddef>
#include <filesystem>
#include <string>

namespace ledger {

namespace po = boost::program_options;

// ═══════════════════════════════════════════════════════════════════════════════
// LedgerConfig - настройки хранилища, передаются в конструкторы явно
// ═══════════════════════════════════════════════════════════════════════════════

struct LedgerConfig {
    bool useSqlite = true;
    std::filesystem::path jsonPath{"data.json"};
    std::filesystem::path sqlitePath{"finance.db"};
    std::filesystem::path schemaPath{"db/schema.sql"};
    std::string baseCurrency = "KZT";
    std::size_t maxImportRows = kDefaultMaxImportRows;
    bool backupEnabled = true;

    // Опции, общие для командной строки и файла конфигурации
    static po::options_description createConfigOptions();

    static Expected<LedgerConfig> fromOptions(const po::variables_map& vm);

    // Дополнить vm значениями из INI-файла; значения командной строки важнее
    static Result mergeConfigFile(const std::filesystem::path& configPath, po::variables_map& vm);
};

} // namespace ledger
