#include "DataManager.h"

#include "CommonUtils.h"
#include "FrameFormat.h"
#include "FrameOps.h"
#include "Log.h"
#include "TabulaExceptions.h"
#include "TypedDataset.h"

#include <filesystem>

namespace Tabula {

namespace {
constexpr size_t kExampleCount = 5;
constexpr size_t kExampleUniqueLimit = 10;

std::string examplesText(const Column& col) {
    std::vector<std::string> parts;
    for (const Scalar& v : FrameOps::uniqueValues(col)) {
        if (scalarIsMissing(v)) continue;
        parts.push_back(FrameFormat::scalarRepr(v));
        if (parts.size() == kExampleCount) break;
    }
    return "[" + CommonUtils::join(parts, ", ") + "]";
}
} // namespace

DataManager::DataManager(std::string dataPath, char delimiter)
    : dataPath_(std::move(dataPath)), delimiter_(delimiter) {}

std::shared_ptr<const DataFrame> DataManager::loadLocked(bool forceReload) {
    if (frame_ && !forceReload) return frame_;

    Log::info("DataManager", "Loading data file" + LogFields().add("path", dataPath_).str());
    std::error_code ec;
    if (!std::filesystem::exists(dataPath_, ec)) {
        throw DataLoadError("Data file not found", dataPath_);
    }

    TypedDataset loader(dataPath_, delimiter_);
    try {
        loader.load();
    } catch (const TabulaException& e) {
        throw DataLoadError(std::string("Error loading data: ") + e.what(), dataPath_);
    } catch (const std::bad_alloc&) {
        throw DataLoadError("Error loading data: out of memory", dataPath_);
    }

    frame_ = std::make_shared<const DataFrame>(loader.release());
    schema_.clear();
    Log::info("DataManager", "Data loaded successfully" +
                                 LogFields().add("rows", frame_->rows()).add("columns", frame_->cols()).str());
    return frame_;
}

std::shared_ptr<const DataFrame> DataManager::frame(bool forceReload) {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadLocked(forceReload);
}

std::string DataManager::schema(bool forceRefresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::shared_ptr<const DataFrame> df = loadLocked(false);
    if (schema_.empty() || forceRefresh) schema_ = describeSchema(*df);
    return schema_;
}

bool DataManager::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frame_ != nullptr;
}

std::string DataManager::describeSchema(const DataFrame& df) {
    std::vector<std::string> parts;
    parts.push_back("Shape: " + std::to_string(df.rows()) + " rows \xC3\x97 " + std::to_string(df.cols()) + " columns\n");
    parts.push_back("Columns:");

    for (const Column& col : df.columns) {
        const size_t nonNull = col.countPresent();
        const size_t unique = FrameOps::countUnique(col);

        std::string detail;
        if (col.type == ColumnType::CATEGORICAL || unique <= kExampleUniqueLimit) {
            detail = " | Examples: " + examplesText(col);
        } else {
            detail = " | Range: [" + FrameFormat::scalarStr(FrameOps::reduce(col, Reduction::MIN)) + ", " +
                     FrameFormat::scalarStr(FrameOps::reduce(col, Reduction::MAX)) + "]";
        }

        parts.push_back("  - " + col.name + ": " + columnTypeName(col.type) + " (" + std::to_string(nonNull) +
                        " non-null, " + std::to_string(unique) + " unique)" + detail);
    }

    return CommonUtils::join(parts, "\n");
}

} // namespace Tabula
