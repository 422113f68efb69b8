#include "repositories/parquet/ParquetSchemas.hpp"

namespace cre::repositories::pq {

std::shared_ptr<arrow::Schema> ParquetSchemas::archive_event_schema() {
    return arrow::schema({
        arrow::field("partition_key", arrow::utf8()),
        arrow::field("sequence_number", arrow::int64()),
        arrow::field("enqueued_at_ms", arrow::int64()),
        arrow::field("event_type", arrow::utf8()),
        arrow::field("body", arrow::utf8()),
    });
}

} // namespace cre::repositories::pq
