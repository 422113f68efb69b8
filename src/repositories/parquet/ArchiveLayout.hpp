#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cre::repositories::pq {

// Inclusive sequence range covered by one archive file.
struct ArchiveFileRange {
    int64_t first;
    int64_t last;
    std::string path;
};

// Archive files live at {prefix}/{partition}/{first:020}_{last:020}.parquet
std::string archive_dir(const std::string& prefix, const std::string& partition_key);
std::string archive_file_name(int64_t first, int64_t last);
std::optional<ArchiveFileRange> parse_archive_path(const std::string& path);

} // namespace cre::repositories::pq
