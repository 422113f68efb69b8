#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cre::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

double env_double_or(const char* name, double fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    return fallback;
}

} // namespace

MalformedEventPolicy parse_malformed_event_policy(const std::string& value) {
    if (value == "fail") return MalformedEventPolicy::Fail;
    if (value == "skip") return MalformedEventPolicy::Skip;
    throw std::invalid_argument("Unknown malformed event policy: " + value);
}

std::string to_string(MalformedEventPolicy policy) {
    switch (policy) {
        case MalformedEventPolicy::Fail: return "fail";
        case MalformedEventPolicy::Skip: return "skip";
    }
    return "fail";
}

Settings Settings::from_environment() {
    std::string env = env_or("CRE_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    s.log.stream_url = env_or("CRE_STREAM_URL", s.log.stream_url);
    s.log.http_base_url = env_or("CRE_HTTP_URL", s.log.http_base_url);
    s.log.partition_key = env_or("CRE_PARTITION", s.log.partition_key);
    s.log.ping_interval_seconds = env_int_or("CRE_PING_INTERVAL", s.log.ping_interval_seconds);
    s.log.connect_timeout_seconds = env_int_or("CRE_CONNECT_TIMEOUT", s.log.connect_timeout_seconds);
    s.log.read_timeout_seconds = env_int_or("CRE_READ_TIMEOUT", s.log.read_timeout_seconds);

    const char* policy = std::getenv("CRE_MALFORMED_EVENT_POLICY");
    if (policy) {
        try {
            s.replication.malformed_event_policy = parse_malformed_event_policy(policy);
        } catch (const std::invalid_argument&) {
            // keep the preset
        }
    }
    s.replication.backoff_initial_ms = env_int_or("CRE_BACKOFF_INITIAL_MS", s.replication.backoff_initial_ms);
    s.replication.backoff_max_ms = env_int_or("CRE_BACKOFF_MAX_MS", s.replication.backoff_max_ms);
    s.replication.backoff_multiplier = env_double_or("CRE_BACKOFF_MULTIPLIER", s.replication.backoff_multiplier);
    s.replication.backoff_jitter = env_double_or("CRE_BACKOFF_JITTER", s.replication.backoff_jitter);

    s.snapshot.interval_seconds = env_int_or("CRE_SNAPSHOT_INTERVAL", s.snapshot.interval_seconds);
    s.snapshot.event_count_threshold = env_int_or("CRE_SNAPSHOT_EVENT_THRESHOLD", s.snapshot.event_count_threshold);
    s.snapshot.check_interval_ms = env_int_or("CRE_SNAPSHOT_CHECK_MS", s.snapshot.check_interval_ms);
    s.snapshot.snapshot_on_stop = env_bool_or("CRE_SNAPSHOT_ON_STOP", s.snapshot.snapshot_on_stop);

    s.storage.backend = env_or("CRE_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("CRE_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.snapshot_prefix = env_or("CRE_SNAPSHOT_PREFIX", s.storage.snapshot_prefix);
    s.storage.archive_prefix = env_or("CRE_ARCHIVE_PREFIX", s.storage.archive_prefix);
    s.storage.archive_buffer_size = env_int_or("CRE_ARCHIVE_BUFFER_SIZE", s.storage.archive_buffer_size);
    s.storage.archive_max_age_seconds = env_int_or("CRE_ARCHIVE_MAX_AGE", s.storage.archive_max_age_seconds);
    s.storage.s3_bucket = env_or("CRE_S3_BUCKET", s.storage.s3_bucket);
    s.storage.s3_prefix = env_or("CRE_S3_PREFIX", s.storage.s3_prefix);
    s.storage.s3_region = env_or("CRE_S3_REGION", s.storage.s3_region);
    s.storage.s3_endpoint_override = env_or("CRE_S3_ENDPOINT", s.storage.s3_endpoint_override);
    s.storage.s3_scheme = env_or("CRE_S3_SCHEME", s.storage.s3_scheme);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.log.read_timeout_seconds = 0;
    s.snapshot.interval_seconds = 10;
    s.snapshot.event_count_threshold = 100;
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.log.ping_interval_seconds = 15;
    s.log.read_timeout_seconds = 120;
    s.replication.backoff_max_ms = 60000;
    s.snapshot.interval_seconds = 300;
    s.snapshot.event_count_threshold = 5000;
    s.storage.backend = "s3";
    s.storage.data_directory = "data/prod";
    s.storage.archive_buffer_size = 4096;
    return s;
}

} // namespace cre::config
