#pragma once

#include "config/Settings.hpp"

#include <arrow/filesystem/api.h>

#include <memory>
#include <string>

namespace cre::repositories {

/// Local filesystem rooted at root_dir (created if needed).
std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

/// S3-compatible filesystem (AWS S3, R2, B2, Wasabi, MinIO) rooted at
/// bucket/prefix. Requires arrow::fs::EnsureS3Initialized() before use.
std::shared_ptr<arrow::fs::FileSystem> make_s3_fs(const cre::config::StorageSettings& settings);

/// Process-local filesystem with nothing persisted.
std::shared_ptr<arrow::fs::FileSystem> make_memory_fs();

/// Dispatch on settings.backend ("local", "s3", "memory").
std::shared_ptr<arrow::fs::FileSystem> make_fs(const cre::config::StorageSettings& settings);

/// Read a whole file into a string.
std::string read_text(arrow::fs::FileSystem& fs, const std::string& path);

} // namespace cre::repositories
