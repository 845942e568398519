#include "CommandExecutor.hpp"
#include "Bootstrap.hpp"
#include "LedgerConfig.hpp"
#include "MigrationEngine.hpp"

namespace ledger {

CommandExecutor::CommandExecutor(std::ostream& out)
    : out_(out)
{
}

std::expected<void, std::string> CommandExecutor::execute(const ParsedCommand& cmd)
{
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "migrate") {
        return executeMigrate(cmd);
    } else if (cmd.command == "bootstrap") {
        return executeBootstrap(cmd);
    } else {
        return std::unexpected("Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Help
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

void CommandExecutor::printHelp(std::string_view topic)
{
    if (topic == "migrate") {
        out_ << "\n" << std::string(70, '=') << std::endl;
        out_ << "COMMAND: migrate" << std::endl;
        out_ << "Move the JSON ledger into SQLite with verification" << std::endl;
        out_ << std::string(70, '=') << std::endl << std::endl;

        out_ << "USAGE:" << std::endl;
        out_ << "  ledger migrate --json-path FILE --sqlite-path FILE [OPTIONS]" << std::endl;
        out_ << std::endl;

        out_ << "OPTIONS:" << std::endl;
        out_ << "  --json-path FILE        Source JSON document (required)" << std::endl;
        out_ << "  --sqlite-path FILE      Target SQLite database (required)" << std::endl;
        out_ << "  --schema-path FILE      SQL schema (default: db/schema.sql)" << std::endl;
        out_ << "  --base-currency CODE    Base currency (default: KZT)" << std::endl;
        out_ << "  --dry-run               Validate only, write nothing" << std::endl;
        out_ << std::endl;

        out_ << "EXAMPLES:" << std::endl;
        out_ << "  ledger migrate --json-path data.json --sqlite-path finance.db --dry-run" << std::endl;
        out_ << std::string(70, '=') << std::endl;

    } else if (topic == "bootstrap") {
        out_ << "\n" << std::string(70, '=') << std::endl;
        out_ << "COMMAND: bootstrap" << std::endl;
        out_ << "Select the active storage and reconcile JSON with SQLite" << std::endl;
        out_ << std::string(70, '=') << std::endl << std::endl;

        out_ << "USAGE:" << std::endl;
        out_ << "  ledger bootstrap [--config FILE] [OPTIONS]" << std::endl;
        out_ << std::endl;

        out_ << "OPTIONS:" << std::endl;
        out_ << "  -c, --config FILE       INI-style configuration file" << std::endl;
        out_ << "  --use-sqlite 0|1        Use SQLite storage (default: 1)" << std::endl;
        out_ << "  --json-path FILE        JSON document (default: data.json)" << std::endl;
        out_ << "  --sqlite-path FILE      SQLite database (default: finance.db)" << std::endl;
        out_ << "  --schema-path FILE      SQL schema (default: db/schema.sql)" << std::endl;
        out_ << "  --base-currency CODE    Base currency (default: KZT)" << std::endl;
        out_ << "  --max-import-rows N     Import row limit (default: 100000)" << std::endl;
        out_ << "  --backup 0|1            Back up JSON before startup (default: 1)" << std::endl;
        out_ << std::string(70, '=') << std::endl;

    } else {
        out_ << "\n" << std::string(70, '=') << std::endl;
        out_ << "Personal Finance Ledger" << std::endl;
        out_ << "Usage: ledger <command> [options]" << std::endl << std::endl;

        out_ << "COMMANDS:" << std::endl;
        out_ << "  migrate                 Migrate JSON ledger to SQLite" << std::endl;
        out_ << "  bootstrap               Select and reconcile the active storage" << std::endl;
        out_ << "  help <command>          Show detailed help for a command" << std::endl;
        out_ << std::endl;

        out_ << "For more information on a specific command, use:" << std::endl;
        out_ << "  ledger help <command>" << std::endl;
        out_ << std::string(70, '=') << std::endl;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Migrate
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeMigrate(const ParsedCommand& cmd)
{
    if (!cmd.options.count("json-path") || !cmd.options.count("sqlite-path")) {
        return std::unexpected("Both --json-path and --sqlite-path are required");
    }

    MigrationOptions options;
    options.jsonPath = cmd.options.at("json-path").as<std::string>();
    options.sqlitePath = cmd.options.at("sqlite-path").as<std::string>();
    if (cmd.options.count("schema-path")) {
        options.schemaPath = cmd.options.at("schema-path").as<std::string>();
    }
    if (cmd.options.count("base-currency")) {
        options.baseCurrency = cmd.options.at("base-currency").as<std::string>();
    }
    if (cmd.options.count("dry-run")) {
        options.dryRun = cmd.options.at("dry-run").as<bool>();
    }

    MigrationEngine engine(options, out_);
    auto report = engine.run();
    if (!report) {
        return std::unexpected(report.error().message);
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Bootstrap
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeBootstrap(const ParsedCommand& cmd)
{
    auto config = LedgerConfig::fromOptions(cmd.options);
    if (!config) {
        return std::unexpected(config.error().message);
    }

    auto storage = bootstrapStorage(*config, out_);
    if (!storage) {
        return std::unexpected(storage.error().message);
    }

    auto snapshot = (*storage)->loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error().message);
    }

    TableCounts counts = countsOf(*snapshot);
    out_ << "[bootstrap] Ready: " << counts.wallets << " wallets, "
         << counts.records << " records, " << counts.transfers << " transfers, "
         << counts.mandatoryExpenses << " mandatory expenses" << std::endl;
    return {};
}

}  // namespace ledger
