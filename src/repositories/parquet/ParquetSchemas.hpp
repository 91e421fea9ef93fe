#pragma once

#include <arrow/api.h>

namespace obr::repositories::pq {

class ParquetSchemas {
public:
    // Raw message log, one row per received frame
    static std::shared_ptr<arrow::Schema> raw_message_schema();

    // Normalized price levels, one row per (event_time, side, price)
    static std::shared_ptr<arrow::Schema> book_level_schema();
};

} // namespace obr::repositories::pq
