#pragma once

#include <string>

namespace cre::config {

enum class MalformedEventPolicy {
    Fail,   // stop the stream on the first undecodable event
    Skip,   // log, count and step over it
};

MalformedEventPolicy parse_malformed_event_policy(const std::string& value);
std::string to_string(MalformedEventPolicy policy);

struct LogSettings {
    std::string stream_url = "ws://localhost:8080/stream";
    std::string http_base_url = "http://localhost:8080";
    std::string partition_key = "0";
    int ping_interval_seconds = 30;
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 300;       // 0 waits forever
};

struct ReplicationSettings {
    MalformedEventPolicy malformed_event_policy = MalformedEventPolicy::Fail;
    int backoff_initial_ms = 100;
    int backoff_max_ms = 30000;
    double backoff_multiplier = 2.0;
    double backoff_jitter = 0.1;
};

struct SnapshotSettings {
    int interval_seconds = 60;            // 0 disables the wall-clock trigger
    int event_count_threshold = 1000;     // 0 disables the event-count trigger
    int check_interval_ms = 1000;
    bool snapshot_on_stop = true;
};

struct StorageSettings {
    std::string backend = "local";        // "local", "s3", or "memory"
    std::string data_directory = "data";
    std::string snapshot_prefix = "snapshots";
    std::string archive_prefix = "archive";
    int archive_buffer_size = 1024;
    int archive_max_age_seconds = 30;
    // S3-compatible storage (AWS S3, Cloudflare R2, Backblaze B2, Wasabi, MinIO)
    std::string s3_bucket;
    std::string s3_prefix = "cre";
    std::string s3_region = "us-east-1";
    std::string s3_endpoint_override;     // non-empty for R2/B2/Wasabi/MinIO
    std::string s3_scheme = "https";      // "http" for local MinIO
};

struct Settings {
    LogSettings log;
    ReplicationSettings replication;
    SnapshotSettings snapshot;
    StorageSettings storage;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace cre::config
