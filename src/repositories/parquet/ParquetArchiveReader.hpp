#pragma once

#include "infrastructure/EventCodec.hpp"
#include "repositories/IArchiveReader.hpp"
#include "repositories/parquet/ArchiveLayout.hpp"

#include <arrow/filesystem/api.h>

#include <memory>
#include <string>
#include <vector>

namespace cre::repositories::pq {

// Reads archived events written by ParquetArchiveWriter (or any capture
// process using the same layout).
class ParquetArchiveReader : public cre::repositories::IArchiveReader {
public:
    ParquetArchiveReader(std::shared_ptr<arrow::fs::FileSystem> fs, std::string prefix);

    std::unique_ptr<IEventCursor> read_range(const std::string& partition_key,
                                             int64_t from_sequence_inclusive,
                                             int64_t to_sequence_exclusive) const override;

    // Files of the partition ordered by first sequence number.
    std::vector<ArchiveFileRange> list_files(const std::string& partition_key) const;

private:
    std::shared_ptr<arrow::fs::FileSystem> fs_;
    std::string prefix_;
    cre::infrastructure::EventCodec codec_;
};

} // namespace cre::repositories::pq
