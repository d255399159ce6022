/**
 * @file CacheStore.hpp
 * @brief Persistence for the incremental review cache.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "domain/ReviewCache.hpp"

namespace clara::infrastructure {

/**
 * @class CacheStore
 * @brief Loads and saves the CacheSnapshot as a versioned JSON file.
 *
 * Loading fails soft: a missing, unreadable, unparseable or outdated file
 * yields "no cache" so the run starts cold instead of aborting.
 */
class CacheStore {
public:
    explicit CacheStore(std::filesystem::path cachePath);

    /** @brief Returns the persisted snapshot, or nullopt when there is no usable cache. */
    std::optional<domain::CacheSnapshot> load() const;

    /**
     * @brief Stamps the current UTC time on the snapshot and replaces the cache file.
     * @return false if the file could not be written; the old file then stays in place.
     */
    bool save(domain::CacheSnapshot& snapshot) const;

    const std::filesystem::path& getPath() const { return m_cachePath; }

    /** @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ". */
    static std::string CurrentTimestamp();

private:
    std::filesystem::path m_cachePath;
};

} // namespace clara::infrastructure
