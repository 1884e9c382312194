#pragma once

#include "DataFrame.h"

#include <memory>
#include <mutex>
#include <string>

namespace Tabula {

/**
 * @brief Lazily loads the dataset once and caches it with its schema text.
 * @details The frame is handed out as shared const, so a reload never
 * invalidates a frame an in-flight query is still using.
 */
class DataManager {
public:
    explicit DataManager(std::string dataPath, char delimiter = ',');

    /**
     * @brief Cached dataset, loading it on first use or when forced.
     * @throws Tabula::DataLoadError (DATA_LOAD_ERROR) when the file is missing or unreadable.
     */
    std::shared_ptr<const DataFrame> frame(bool forceReload = false);

    /**
     * @brief Cached schema description handed to code generators.
     * @throws Tabula::DataLoadError when the dataset cannot be loaded.
     */
    std::string schema(bool forceRefresh = false);

    bool isLoaded() const;
    const std::string& path() const noexcept { return dataPath_; }

    /**
     * @brief `Shape: R rows × C columns`, then one line per column with dtype,
     * non-null and unique counts, and examples (object or <= 10 unique) or a range.
     */
    static std::string describeSchema(const DataFrame& df);

private:
    std::string dataPath_;
    char delimiter_;
    mutable std::mutex mutex_;
    std::shared_ptr<const DataFrame> frame_;
    std::string schema_;

    std::shared_ptr<const DataFrame> loadLocked(bool forceReload);
};

} // namespace Tabula
