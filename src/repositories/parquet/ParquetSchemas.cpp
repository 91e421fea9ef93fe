#include "repositories/parquet/ParquetSchemas.hpp"

namespace obr::repositories::pq {

std::shared_ptr<arrow::Schema> ParquetSchemas::raw_message_schema() {
    return arrow::schema({
        arrow::field("symbol", arrow::utf8(), /*nullable=*/false),
        arrow::field("channel", arrow::utf8(), /*nullable=*/false),
        arrow::field("event_time_us", arrow::int64(), /*nullable=*/false),
        arrow::field("received_time_us", arrow::int64(), /*nullable=*/false),
        arrow::field("sequence_id", arrow::uint64(), /*nullable=*/false),
        arrow::field("message_kind", arrow::uint8(), /*nullable=*/false),
        arrow::field("checksum", arrow::int64()),
        arrow::field("payload", arrow::utf8(), /*nullable=*/false),
    });
}

std::shared_ptr<arrow::Schema> ParquetSchemas::book_level_schema() {
    return arrow::schema({
        arrow::field("symbol", arrow::utf8(), /*nullable=*/false),
        arrow::field("event_time_us", arrow::int64(), /*nullable=*/false),
        arrow::field("side", arrow::uint8(), /*nullable=*/false),
        arrow::field("price", arrow::float64(), /*nullable=*/false),
        arrow::field("quantity", arrow::float64(), /*nullable=*/false),
        arrow::field("message_kind", arrow::uint8(), /*nullable=*/false),
        arrow::field("checksum", arrow::int64()),
    });
}

} // namespace obr::repositories::pq
