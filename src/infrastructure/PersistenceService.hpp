/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file writes.
 */

#pragma once
#include <string>

namespace highlightdigest::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes whole files through a temp file and a rename, so readers
 * never observe a half-written store.
 */
class PersistenceService {
public:
    /**
     * @brief Writes @p content to @p filename atomically, creating parent directories.
     * @param error Receives a description of the failure.
     * @return True on success. The previous file is untouched on failure.
     */
    bool writeTextAtomic(const std::string& filename, const std::string& content, std::string& error);
};

} // namespace highlightdigest::infrastructure
