/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace highlightdigest::infrastructure {

namespace fs = std::filesystem;

bool PersistenceService::writeTextAtomic(const std::string& filename, const std::string& content, std::string& error) {
    fs::path finalPath = filename;

    // Temp file lives next to the target so the rename stays on one filesystem.
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + finalPath.parent_path().string() + ": " + ec.message();
            std::cerr << "[PersistenceService] " << error << std::endl;
            return false;
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            error = "cannot open temp file " + tempPath.string();
            std::cerr << "[PersistenceService] " << error << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            error = "write failed for " + tempPath.string();
            std::cerr << "[PersistenceService] " << error << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "rename failed: " + ec.message();
        std::cerr << "[PersistenceService] " << error << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace highlightdigest::infrastructure
