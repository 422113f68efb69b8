#include "repositories/parquet/ArchiveLayout.hpp"

#include <iomanip>
#include <sstream>

namespace cre::repositories::pq {

namespace {

constexpr const char* kExtension = ".parquet";

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<int64_t> parse_digits(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoll(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

std::string archive_dir(const std::string& prefix, const std::string& partition_key) {
    return prefix + "/" + partition_key;
}

std::string archive_file_name(int64_t first, int64_t last) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(20) << first << "_"
        << std::setfill('0') << std::setw(20) << last << kExtension;
    return oss.str();
}

std::optional<ArchiveFileRange> parse_archive_path(const std::string& path) {
    if (!ends_with(path, kExtension)) return std::nullopt;

    auto slash = path.rfind('/');
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    std::string stem = filename.substr(0, filename.size() - std::string(kExtension).size());

    // Format: {first}_{last}
    auto underscore = stem.find('_');
    if (underscore == std::string::npos) return std::nullopt;

    auto first = parse_digits(stem.substr(0, underscore));
    auto last = parse_digits(stem.substr(underscore + 1));
    if (!first || !last || *last < *first) return std::nullopt;

    return ArchiveFileRange{*first, *last, path};
}

} // namespace cre::repositories::pq
