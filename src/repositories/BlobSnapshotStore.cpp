#include "repositories/BlobSnapshotStore.hpp"

#include "errors/ReplicationErrors.hpp"
#include "repositories/ArrowChecks.hpp"
#include "repositories/FileSystems.hpp"

#include <arrow/io/interfaces.h>
#include <nlohmann/json.hpp>

#include <iomanip>
#include <optional>
#include <sstream>

namespace cre::repositories {

namespace {

constexpr const char* kSuffix = ".json";

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Filename stem without directory or extension
std::string stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return filename;
    return filename.substr(0, dot);
}

std::optional<int64_t> parse_sequence(const std::string& path) {
    auto s = stem(path);
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

BlobSnapshotStore::BlobSnapshotStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string prefix)
    : fs_(std::move(fs)), prefix_(std::move(prefix)) {}

std::optional<Snapshot> BlobSnapshotStore::load_latest(const std::string& partition_key) const {
    std::lock_guard lock(mutex_);

    std::optional<int64_t> seq;
    std::string path;
    std::string content;
    try {
        seq = latest_sequence(partition_key);
        if (!seq) return std::nullopt;
        path = snapshot_path(partition_key, *seq);
        content = read_text(*fs_, path);
    } catch (const std::runtime_error& e) {
        throw errors::TransientTransportError(std::string("snapshot store: ") + e.what());
    }

    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("payload")
        || !doc["payload"].is_string()) {
        throw errors::MalformedEventError("snapshot file " + path + " is not a snapshot document");
    }

    std::optional<domain::Timestamp> created_at;
    try {
        created_at = domain::Timestamp(doc.value("created_at_ms", int64_t{0}));
    } catch (const nlohmann::json::exception& e) {
        throw errors::MalformedEventError("snapshot file " + path + ": " + e.what());
    } catch (const std::out_of_range& e) {
        throw errors::MalformedEventError("snapshot file " + path + ": " + e.what());
    }

    return Snapshot{
        partition_key,
        *seq,
        doc["payload"].get<std::string>(),
        *created_at,
    };
}

bool BlobSnapshotStore::store(const Snapshot& snapshot) {
    std::lock_guard lock(mutex_);

    std::optional<int64_t> latest;
    try {
        latest = latest_sequence(snapshot.partition_key);
    } catch (const std::runtime_error& e) {
        throw errors::SnapshotWriteError(e.what());
    }
    if (latest && *latest >= snapshot.sequence_number) {
        return false;
    }

    nlohmann::json doc{
        {"partition_key", snapshot.partition_key},
        {"sequence_number", snapshot.sequence_number},
        {"created_at_ms", snapshot.created_at.milliseconds()},
        {"payload", snapshot.payload},
    };
    std::string content = doc.dump();

    // Write beside the final key, then move into place so readers never see
    // a half-written blob.
    std::string path = snapshot_path(snapshot.partition_key, snapshot.sequence_number);
    std::string tmp_path = path + ".tmp";

    check<errors::SnapshotWriteError>(
        fs_->CreateDir(partition_dir(snapshot.partition_key), /*recursive=*/true),
        "create snapshot directory");
    auto stream = value_or_throw<errors::SnapshotWriteError>(
        fs_->OpenOutputStream(tmp_path), "open " + tmp_path);
    check<errors::SnapshotWriteError>(
        stream->Write(content.data(), static_cast<int64_t>(content.size())), "write " + tmp_path);
    check<errors::SnapshotWriteError>(stream->Close(), "close " + tmp_path);
    check<errors::SnapshotWriteError>(fs_->Move(tmp_path, path), "move " + tmp_path);
    return true;
}

std::string BlobSnapshotStore::snapshot_path(const std::string& partition_key,
                                             int64_t sequence_number) const {
    std::ostringstream oss;
    oss << partition_dir(partition_key) << "/"
        << std::setfill('0') << std::setw(20) << sequence_number << kSuffix;
    return oss.str();
}

std::string BlobSnapshotStore::partition_dir(const std::string& partition_key) const {
    return prefix_ + "/" + partition_key;
}

std::optional<int64_t> BlobSnapshotStore::latest_sequence(const std::string& partition_key) const {
    arrow::fs::FileSelector selector;
    selector.base_dir = partition_dir(partition_key);
    selector.allow_not_found = true;
    selector.recursive = false;

    auto listing = value_or_throw(fs_->GetFileInfo(selector), "list " + selector.base_dir);

    std::optional<int64_t> latest;
    for (const auto& info : listing) {
        if (info.type() != arrow::fs::FileType::File) continue;
        if (!ends_with(info.path(), kSuffix)) continue;
        auto seq = parse_sequence(info.path());
        if (seq && (!latest || *seq > *latest)) {
            latest = seq;
        }
    }
    return latest;
}

} // namespace cre::repositories
