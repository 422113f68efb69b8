#include "repositories/FileSystems.hpp"

#include "repositories/ArrowChecks.hpp"

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/mockfs.h>
#include <arrow/filesystem/s3fs.h>
#include <arrow/io/interfaces.h>

#include <chrono>
#include <stdexcept>

namespace cre::repositories {

std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root_dir, /*recursive=*/true), "create " + root_dir);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

std::shared_ptr<arrow::fs::FileSystem> make_s3_fs(const cre::config::StorageSettings& settings) {
    if (settings.s3_bucket.empty()) {
        throw std::invalid_argument("S3 backend requires CRE_S3_BUCKET");
    }

    auto options = arrow::fs::S3Options::Defaults();
    options.region = settings.s3_region;
    options.scheme = settings.s3_scheme;
    if (!settings.s3_endpoint_override.empty()) {
        options.endpoint_override = settings.s3_endpoint_override;
    }

    auto s3fs = value_or_throw(arrow::fs::S3FileSystem::Make(options), "connect S3");
    std::string base_path = settings.s3_bucket;
    if (!settings.s3_prefix.empty()) {
        base_path += "/" + settings.s3_prefix;
    }
    return std::make_shared<arrow::fs::SubTreeFileSystem>(base_path, s3fs);
}

std::shared_ptr<arrow::fs::FileSystem> make_memory_fs() {
    auto mock = std::make_shared<arrow::fs::internal::MockFileSystem>(
        arrow::fs::TimePoint(std::chrono::seconds(0)));
    return std::make_shared<arrow::fs::SubTreeFileSystem>("/", mock);
}

std::shared_ptr<arrow::fs::FileSystem> make_fs(const cre::config::StorageSettings& settings) {
    if (settings.backend == "s3") return make_s3_fs(settings);
    if (settings.backend == "local") return make_local_fs(settings.data_directory);
    if (settings.backend == "memory") return make_memory_fs();
    throw std::invalid_argument("Unknown storage backend: " + settings.backend);
}

std::string read_text(arrow::fs::FileSystem& fs, const std::string& path) {
    auto file = value_or_throw(fs.OpenInputFile(path), "open " + path);
    auto size = value_or_throw(file->GetSize(), "stat " + path);
    auto buffer = value_or_throw(file->Read(size), "read " + path);
    check(file->Close(), "close " + path);
    return std::string(reinterpret_cast<const char*>(buffer->data()),
                       static_cast<size_t>(buffer->size()));
}

} // namespace cre::repositories
