#pragma once

#include "config/Settings.hpp"
#include "domain/events/ConfigEventVariant.hpp"
#include "infrastructure/EventCodec.hpp"
#include "repositories/IArchiveWriter.hpp"

#include <arrow/filesystem/api.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cre::repositories::pq {

// Capture side of the archive: buffers events per partition and writes each
// contiguous run as one Parquet file named by its sequence range.
class ParquetArchiveWriter : public IArchiveWriter {
public:
    ParquetArchiveWriter(std::shared_ptr<arrow::fs::FileSystem> fs,
                         const cre::config::StorageSettings& settings);
    ~ParquetArchiveWriter() override;

    ParquetArchiveWriter(const ParquetArchiveWriter&) = delete;
    ParquetArchiveWriter& operator=(const ParquetArchiveWriter&) = delete;

    // Events at or below the partition's last appended sequence are ignored.
    // A jump in sequence numbers closes the current file first so every file
    // covers a contiguous range.
    void append(const cre::domain::ConfigEventVariant& event) override;
    void flush() override;
    // Flushes if the buffer is full or archive_max_age_seconds has passed
    // since the last flush. Lets a quiet partition still reach storage.
    void flush_if_due() override;

    size_t buffered_count() const;
    size_t files_written() const;

private:
    void maybe_flush();
    void flush_locked();
    void flush_partition(const std::string& partition_key,
                         const std::vector<cre::domain::ConfigEventVariant>& events);

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    cre::config::StorageSettings settings_;
    cre::infrastructure::EventCodec codec_;
    mutable std::mutex mutex_;

    std::map<std::string, std::vector<cre::domain::ConfigEventVariant>> buffers_;
    std::map<std::string, int64_t> last_appended_;
    std::chrono::steady_clock::time_point last_flush_time_;
    size_t files_written_{0};
};

} // namespace cre::repositories::pq
