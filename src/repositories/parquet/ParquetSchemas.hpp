#pragma once

#include <arrow/api.h>

namespace cre::repositories::pq {

class ParquetSchemas {
public:
    // One row per archived event: header columns plus the JSON body.
    static std::shared_ptr<arrow::Schema> archive_event_schema();
};

} // namespace cre::repositories::pq
