/**
 * @file Errors.hpp
 * @brief Fatal error taxonomy. Per-entry parse problems are SkipReason values, not errors.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace highlightdigest::domain {

/**
 * @class DigestError
 * @brief Base class of every run-aborting failure.
 */
class DigestError : public std::runtime_error {
public:
    explicit DigestError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief The clippings file cannot be opened or read. */
class SourceUnreadableError : public DigestError {
public:
    explicit SourceUnreadableError(const std::string& path)
        : DigestError("Cannot read clippings file: " + path) {}
};

/** @brief The persisted store exists but is not a valid highlight document. */
class StoreCorruptError : public DigestError {
public:
    StoreCorruptError(const std::string& path, const std::string& detail)
        : DigestError("Highlight store is corrupt (" + path + "): " + detail) {}
};

/** @brief The persisted store could not be rewritten. */
class StoreUnwritableError : public DigestError {
public:
    StoreUnwritableError(const std::string& path, const std::string& detail)
        : DigestError("Cannot write highlight store (" + path + "): " + detail) {}
};

/** @brief A required setting is absent. */
class ConfigMissingError : public DigestError {
public:
    explicit ConfigMissingError(const std::string& key)
        : DigestError(key + " is required but was not configured.") {}
};

/** @brief The digest could not be delivered. */
class DeliveryFailedError : public DigestError {
public:
    explicit DeliveryFailedError(const std::string& detail)
        : DigestError("Digest delivery failed: " + detail) {}
};

} // namespace highlightdigest::domain
