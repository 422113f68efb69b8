#include "repositories/parquet/ParquetArchiveReader.hpp"

#include "errors/ReplicationErrors.hpp"
#include "repositories/ArrowChecks.hpp"

#include <arrow/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>

#include <algorithm>
#include <deque>

using namespace cre::domain;
using cre::errors::RangeUnavailableError;
using cre::errors::TransientTransportError;

namespace cre::repositories::pq {

namespace {

struct ArchiveRow {
    int64_t sequence_number;
    int64_t enqueued_at_ms;
    std::string partition_key;
    std::string event_type;
    std::string body;
};

template <typename ArrayType>
std::shared_ptr<ArrayType> column_as(const std::shared_ptr<arrow::Table>& table,
                                     const std::string& name) {
    auto column = table->GetColumnByName(name);
    if (!column || column->num_chunks() == 0) {
        throw std::runtime_error("missing column '" + name + "'");
    }
    auto array = std::dynamic_pointer_cast<ArrayType>(column->chunk(0));
    if (!array) {
        throw std::runtime_error("column '" + name + "' has unexpected type");
    }
    return array;
}

class ParquetArchiveCursor : public IEventCursor {
public:
    ParquetArchiveCursor(std::shared_ptr<arrow::fs::FileSystem> fs,
                         const cre::infrastructure::EventCodec& codec,
                         std::string partition_key,
                         std::vector<ArchiveFileRange> files,
                         int64_t from, int64_t to)
        : fs_(std::move(fs))
        , codec_(codec)
        , partition_key_(std::move(partition_key))
        , files_(files.begin(), files.end())
        , expected_(from)
        , to_(to) {}

    std::optional<ConfigEventVariant> next() override {
        while (expected_ < to_) {
            if (!rows_.empty()) {
                auto row = std::move(rows_.front());
                rows_.pop_front();
                if (row.sequence_number < expected_) continue;  // overlap with previous file
                if (row.sequence_number > expected_) {
                    throw RangeUnavailableError(partition_key_, expected_, to_,
                        "archive jumps to #" + std::to_string(row.sequence_number));
                }
                // Advance first so a decode failure leaves the cursor past this row.
                ++expected_;
                ConfigEvent header{row.partition_key, row.sequence_number,
                                   Timestamp(row.enqueued_at_ms)};
                return codec_.decode_body(header, row.event_type, row.body);
            }

            if (files_.empty()) {
                throw RangeUnavailableError(partition_key_, expected_, to_,
                    "archive files end before the range does");
            }
            auto file = std::move(files_.front());
            files_.pop_front();
            if (file.last < expected_) continue;
            load(file);
        }
        return std::nullopt;
    }

private:
    void load(const ArchiveFileRange& file) {
        std::shared_ptr<arrow::Table> table;
        try {
            auto infile = value_or_throw<TransientTransportError>(
                fs_->OpenInputFile(file.path), "open " + file.path);
            auto reader = value_or_throw<TransientTransportError>(
                ::parquet::arrow::FileReader::Make(arrow::default_memory_pool(),
                                                   ::parquet::ParquetFileReader::Open(infile)),
                "open parquet " + file.path);
            check<TransientTransportError>(reader->ReadTable(&table), "read " + file.path);
        } catch (const ::parquet::ParquetException& e) {
            throw RangeUnavailableError(partition_key_, expected_, to_,
                "corrupt archive file " + file.path + ": " + e.what());
        }

        std::vector<ArchiveRow> rows;
        if (table->num_rows() > 0) {
            try {
                auto combined = value_or_throw(table->CombineChunks(), "combine " + file.path);
                auto partition_col = column_as<arrow::StringArray>(combined, "partition_key");
                auto seq_col = column_as<arrow::Int64Array>(combined, "sequence_number");
                auto enqueued_col = column_as<arrow::Int64Array>(combined, "enqueued_at_ms");
                auto type_col = column_as<arrow::StringArray>(combined, "event_type");
                auto body_col = column_as<arrow::StringArray>(combined, "body");

                rows.reserve(static_cast<size_t>(combined->num_rows()));
                for (int64_t i = 0; i < combined->num_rows(); ++i) {
                    int64_t seq = seq_col->Value(i);
                    if (seq < expected_ || seq >= to_) continue;
                    if (partition_col->GetString(i) != partition_key_) continue;
                    rows.push_back(ArchiveRow{
                        seq,
                        enqueued_col->Value(i),
                        partition_col->GetString(i),
                        type_col->GetString(i),
                        body_col->GetString(i),
                    });
                }
            } catch (const std::runtime_error& e) {
                throw RangeUnavailableError(partition_key_, expected_, to_,
                    "unreadable archive file " + file.path + ": " + e.what());
            }
        }

        std::sort(rows.begin(), rows.end(), [](const ArchiveRow& a, const ArchiveRow& b) {
            return a.sequence_number < b.sequence_number;
        });
        rows_.assign(std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    }

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    cre::infrastructure::EventCodec codec_;
    std::string partition_key_;
    std::deque<ArchiveFileRange> files_;
    std::deque<ArchiveRow> rows_;
    int64_t expected_;
    int64_t to_;
};

class EmptyCursor : public IEventCursor {
public:
    std::optional<ConfigEventVariant> next() override { return std::nullopt; }
};

} // namespace

ParquetArchiveReader::ParquetArchiveReader(std::shared_ptr<arrow::fs::FileSystem> fs,
                                           std::string prefix)
    : fs_(std::move(fs)), prefix_(std::move(prefix)) {}

std::vector<ArchiveFileRange> ParquetArchiveReader::list_files(
    const std::string& partition_key) const {
    arrow::fs::FileSelector selector;
    selector.base_dir = archive_dir(prefix_, partition_key);
    selector.allow_not_found = true;
    selector.recursive = true;

    auto listing = value_or_throw<TransientTransportError>(
        fs_->GetFileInfo(selector), "list " + selector.base_dir);

    std::vector<ArchiveFileRange> files;
    for (const auto& info : listing) {
        if (info.type() != arrow::fs::FileType::File) continue;
        auto range = parse_archive_path(info.path());
        if (range) files.push_back(std::move(*range));
    }

    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return a.first < b.first || (a.first == b.first && a.last > b.last);
    });
    return files;
}

std::unique_ptr<IEventCursor> ParquetArchiveReader::read_range(
    const std::string& partition_key, int64_t from, int64_t to) const {
    if (from >= to) return std::make_unique<EmptyCursor>();

    // Validate coverage from the file index before yielding anything.
    std::vector<ArchiveFileRange> needed;
    int64_t covered = from;
    for (auto& file : list_files(partition_key)) {
        if (covered >= to) break;
        if (file.last < covered) continue;
        if (file.first > covered) break;
        covered = file.last + 1;
        needed.push_back(std::move(file));
    }

    if (covered < to) {
        throw RangeUnavailableError(partition_key, covered, to,
            "no archive file starts at #" + std::to_string(covered));
    }

    return std::make_unique<ParquetArchiveCursor>(fs_, codec_, partition_key,
                                                  std::move(needed), from, to);
}

} // namespace cre::repositories::pq
