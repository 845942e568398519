#include "BackupManager.hpp"
#include "JsonFileStorage.hpp"
#include "SQLiteStorage.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ledger {

BackupManager::BackupManager(std::ostream& log)
    : log_(log)
{
}

std::filesystem::path BackupManager::backupPathFor(
    const std::filesystem::path& jsonPath,
    std::chrono::system_clock::time_point now)
{
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream name;
    name << jsonPath.stem().string() << "_backup_"
         << std::put_time(&local, "%Y%m%d_%H%M%S")
         << jsonPath.extension().string();

    return jsonPath.parent_path() / "backups" / name.str();
}

Expected<std::optional<std::filesystem::path>> BackupManager::createBackup(
    const std::filesystem::path& jsonPath,
    std::chrono::system_clock::time_point now)
{
    if (!std::filesystem::exists(jsonPath)) {
        return std::optional<std::filesystem::path>{};
    }

    std::filesystem::path target = backupPathFor(jsonPath, now);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return makeError(ErrorKind::Storage,
            "Failed to create backup directory " + target.parent_path().string() + ": " + ec.message());
    }

    std::filesystem::copy_file(jsonPath, target,
        std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return makeError(ErrorKind::Storage,
            "Failed to create backup " + target.string() + ": " + ec.message());
    }

    log_ << "[backup] JSON backup created: " << target.string() << "\n";
    return std::optional<std::filesystem::path>{target};
}

Result BackupManager::exportToJson(SQLiteStorage& sqlite, const std::filesystem::path& jsonPath) {
    auto snapshot = sqlite.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    JsonFileStorage writer(jsonPath);
    auto written = writer.replaceAllData(*snapshot);
    if (!written) {
        return written;
    }

    log_ << "[backup] SQLite exported to JSON: " << jsonPath.string() << "\n";
    return {};
}

} // namespace ledger
