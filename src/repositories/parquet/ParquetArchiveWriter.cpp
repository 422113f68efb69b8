#include "repositories/parquet/ParquetArchiveWriter.hpp"

#include "repositories/ArrowChecks.hpp"
#include "repositories/parquet/ArchiveLayout.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include <arrow/api.h>
#include <parquet/arrow/writer.h>

#include <iostream>

using namespace cre::domain;

namespace cre::repositories::pq {

namespace {

arrow::Result<std::shared_ptr<arrow::Table>> build_table(
    const std::vector<ConfigEventVariant>& events,
    const cre::infrastructure::EventCodec& codec) {

    arrow::StringBuilder partition_builder, type_builder, body_builder;
    arrow::Int64Builder seq_builder, enqueued_builder;

    for (const auto& event : events) {
        ARROW_RETURN_NOT_OK(partition_builder.Append(partition_of(event)));
        ARROW_RETURN_NOT_OK(seq_builder.Append(sequence_of(event)));
        ARROW_RETURN_NOT_OK(enqueued_builder.Append(enqueued_at_of(event).milliseconds()));
        ARROW_RETURN_NOT_OK(type_builder.Append(cre::infrastructure::EventCodec::event_type(event)));
        ARROW_RETURN_NOT_OK(body_builder.Append(codec.encode_body(event)));
    }

    std::shared_ptr<arrow::Array> arr_partition, arr_seq, arr_enqueued, arr_type, arr_body;
    ARROW_RETURN_NOT_OK(partition_builder.Finish(&arr_partition));
    ARROW_RETURN_NOT_OK(seq_builder.Finish(&arr_seq));
    ARROW_RETURN_NOT_OK(enqueued_builder.Finish(&arr_enqueued));
    ARROW_RETURN_NOT_OK(type_builder.Finish(&arr_type));
    ARROW_RETURN_NOT_OK(body_builder.Finish(&arr_body));

    return arrow::Table::Make(ParquetSchemas::archive_event_schema(),
        {arr_partition, arr_seq, arr_enqueued, arr_type, arr_body});
}

} // namespace

ParquetArchiveWriter::ParquetArchiveWriter(std::shared_ptr<arrow::fs::FileSystem> fs,
                                           const cre::config::StorageSettings& settings)
    : fs_(std::move(fs))
    , settings_(settings)
    , last_flush_time_(std::chrono::steady_clock::now()) {}

ParquetArchiveWriter::~ParquetArchiveWriter() {
    std::lock_guard lock(mutex_);
    try {
        flush_locked();
    } catch (const std::exception& e) {
        std::cerr << "[archive] Final flush failed: " << e.what() << std::endl;
    }
}

void ParquetArchiveWriter::append(const ConfigEventVariant& event) {
    std::lock_guard lock(mutex_);

    const auto& partition = partition_of(event);
    auto seq = sequence_of(event);

    auto last_it = last_appended_.find(partition);
    if (last_it != last_appended_.end()) {
        if (seq <= last_it->second) return;
        if (seq != last_it->second + 1) {
            auto& pending = buffers_[partition];
            if (!pending.empty()) {
                flush_partition(partition, pending);
                pending.clear();
            }
        }
    }

    buffers_[partition].push_back(event);
    last_appended_[partition] = seq;

    maybe_flush();
}

void ParquetArchiveWriter::flush() {
    std::lock_guard lock(mutex_);
    flush_locked();
}

size_t ParquetArchiveWriter::buffered_count() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [partition, events] : buffers_) {
        total += events.size();
    }
    return total;
}

size_t ParquetArchiveWriter::files_written() const {
    std::lock_guard lock(mutex_);
    return files_written_;
}

void ParquetArchiveWriter::flush_if_due() {
    std::lock_guard lock(mutex_);
    maybe_flush();
}

void ParquetArchiveWriter::maybe_flush() {
    size_t total = 0;
    for (const auto& [partition, events] : buffers_) {
        total += events.size();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - last_flush_time_).count();

    if (total >= static_cast<size_t>(settings_.archive_buffer_size)
        || elapsed >= settings_.archive_max_age_seconds) {
        flush_locked();
    }
}

void ParquetArchiveWriter::flush_locked() {
    for (auto& [partition, events] : buffers_) {
        if (!events.empty()) {
            flush_partition(partition, events);
            events.clear();
        }
    }
    last_flush_time_ = std::chrono::steady_clock::now();
}

void ParquetArchiveWriter::flush_partition(const std::string& partition_key,
                                           const std::vector<ConfigEventVariant>& events) {
    if (events.empty()) return;

    int64_t first = sequence_of(events.front());
    int64_t last = sequence_of(events.back());

    std::string dir = archive_dir(settings_.archive_prefix, partition_key);
    check(fs_->CreateDir(dir, /*recursive=*/true), "create " + dir);

    std::string path = dir + "/" + archive_file_name(first, last);
    auto table = value_or_throw(build_table(events, codec_), "build archive table");

    // Readers trust a file's name for its coverage, so it only appears under
    // that name once complete.
    std::string tmp_path = path + ".tmp";
    auto outfile = value_or_throw(fs_->OpenOutputStream(tmp_path), "open " + tmp_path);
    check(::parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                       static_cast<int64_t>(events.size())),
          "write " + tmp_path);
    check(outfile->Close(), "close " + tmp_path);
    check(fs_->Move(tmp_path, path), "move " + tmp_path);

    ++files_written_;
    std::cout << "[archive] Wrote " << path << " (" << events.size() << " events)" << std::endl;
}

} // namespace cre::repositories::pq
