#include "repositories/parquet/ParquetEventStore.hpp"
#include "domain/Errors.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/api.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

using namespace obr::domain;

namespace obr::repositories::pq {

namespace {

constexpr int64_t kMicrosPerHour = int64_t{3600} * 1000 * 1000;

// Rows kept in memory while flushes fail, as a multiple of write_buffer_size.
constexpr size_t kBacklogMultiple = 4;
constexpr auto kFlushRetryDelay = std::chrono::seconds(1);

[[noreturn]] void raise(const arrow::Status& status, const std::string& what) {
    std::string message = what + ": " + status.ToString();
    if (status.IsIOError() || status.IsCancelled()) {
        throw TransientStoreError(message);
    }
    throw PermanentStoreError(message);
}

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) raise(status, what);
}

template <typename T>
T unwrap(arrow::Result<T> result, const std::string& what) {
    if (!result.ok()) raise(result.status(), what);
    return std::move(result).ValueOrDie();
}

template <typename ArrayType>
std::shared_ptr<ArrayType> column(const arrow::Table& table, const std::string& name) {
    auto chunked = table.GetColumnByName(name);
    if (!chunked || chunked->num_chunks() != 1) {
        throw PermanentStoreError("Parquet file is missing column " + name);
    }
    return std::static_pointer_cast<ArrayType>(chunked->chunk(0));
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Extract filename stem from a path string (no directory, no extension)
std::string stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return filename;
    return filename.substr(0, dot);
}

// Name of the directory holding `path` ("raw/X/2025-11-08/f.parquet" -> "2025-11-08")
std::string parent_name(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return "";
    auto prev = path.rfind('/', slash - 1);
    size_t begin = (prev == std::string::npos) ? 0 : prev + 1;
    return path.substr(begin, slash - begin);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(str);
    while (std::getline(stream, part, delim)) {
        parts.push_back(part);
    }
    return parts;
}

// "<epoch_us>-<counter>" -> sortable pair
std::pair<int64_t, uint64_t> batch_order(const std::string& batch) {
    auto dash = batch.find('-');
    if (dash == std::string::npos) return {0, 0};
    return {std::stoll(batch.substr(0, dash)), std::stoull(batch.substr(dash + 1))};
}

arrow::Result<std::shared_ptr<arrow::Table>> build_raw_table(
    const std::vector<RawMessageRecord>& records) {
    arrow::StringBuilder symbol_b, channel_b, payload_b;
    arrow::Int64Builder event_time_b, received_time_b, checksum_b;
    arrow::UInt64Builder seq_b;
    arrow::UInt8Builder kind_b;

    for (const auto& r : records) {
        ARROW_RETURN_NOT_OK(symbol_b.Append(r.symbol));
        ARROW_RETURN_NOT_OK(channel_b.Append(r.channel));
        ARROW_RETURN_NOT_OK(event_time_b.Append(r.event_time.microseconds()));
        ARROW_RETURN_NOT_OK(received_time_b.Append(r.received_time.microseconds()));
        ARROW_RETURN_NOT_OK(seq_b.Append(r.sequence_id));
        ARROW_RETURN_NOT_OK(kind_b.Append(static_cast<uint8_t>(r.message_kind)));
        if (r.checksum) {
            ARROW_RETURN_NOT_OK(checksum_b.Append(*r.checksum));
        } else {
            ARROW_RETURN_NOT_OK(checksum_b.AppendNull());
        }
        ARROW_RETURN_NOT_OK(payload_b.Append(r.payload));
    }

    std::shared_ptr<arrow::Array> arr_symbol, arr_channel, arr_event, arr_received;
    std::shared_ptr<arrow::Array> arr_seq, arr_kind, arr_checksum, arr_payload;
    ARROW_RETURN_NOT_OK(symbol_b.Finish(&arr_symbol));
    ARROW_RETURN_NOT_OK(channel_b.Finish(&arr_channel));
    ARROW_RETURN_NOT_OK(event_time_b.Finish(&arr_event));
    ARROW_RETURN_NOT_OK(received_time_b.Finish(&arr_received));
    ARROW_RETURN_NOT_OK(seq_b.Finish(&arr_seq));
    ARROW_RETURN_NOT_OK(kind_b.Finish(&arr_kind));
    ARROW_RETURN_NOT_OK(checksum_b.Finish(&arr_checksum));
    ARROW_RETURN_NOT_OK(payload_b.Finish(&arr_payload));

    return arrow::Table::Make(ParquetSchemas::raw_message_schema(),
        {arr_symbol, arr_channel, arr_event, arr_received, arr_seq, arr_kind, arr_checksum, arr_payload});
}

arrow::Result<std::shared_ptr<arrow::Table>> build_levels_table(
    const std::vector<BookLevelRecord>& records) {
    arrow::StringBuilder symbol_b;
    arrow::Int64Builder event_time_b, checksum_b;
    arrow::UInt8Builder side_b, kind_b;
    arrow::DoubleBuilder price_b, quantity_b;

    for (const auto& l : records) {
        ARROW_RETURN_NOT_OK(symbol_b.Append(l.symbol));
        ARROW_RETURN_NOT_OK(event_time_b.Append(l.event_time.microseconds()));
        ARROW_RETURN_NOT_OK(side_b.Append(static_cast<uint8_t>(l.side)));
        ARROW_RETURN_NOT_OK(price_b.Append(l.price.value()));
        ARROW_RETURN_NOT_OK(quantity_b.Append(l.quantity.value()));
        ARROW_RETURN_NOT_OK(kind_b.Append(static_cast<uint8_t>(l.message_kind)));
        if (l.checksum) {
            ARROW_RETURN_NOT_OK(checksum_b.Append(*l.checksum));
        } else {
            ARROW_RETURN_NOT_OK(checksum_b.AppendNull());
        }
    }

    std::shared_ptr<arrow::Array> arr_symbol, arr_event, arr_side, arr_price;
    std::shared_ptr<arrow::Array> arr_quantity, arr_kind, arr_checksum;
    ARROW_RETURN_NOT_OK(symbol_b.Finish(&arr_symbol));
    ARROW_RETURN_NOT_OK(event_time_b.Finish(&arr_event));
    ARROW_RETURN_NOT_OK(side_b.Finish(&arr_side));
    ARROW_RETURN_NOT_OK(price_b.Finish(&arr_price));
    ARROW_RETURN_NOT_OK(quantity_b.Finish(&arr_quantity));
    ARROW_RETURN_NOT_OK(kind_b.Finish(&arr_kind));
    ARROW_RETURN_NOT_OK(checksum_b.Finish(&arr_checksum));

    return arrow::Table::Make(ParquetSchemas::book_level_schema(),
        {arr_symbol, arr_event, arr_side, arr_price, arr_quantity, arr_kind, arr_checksum});
}

using LevelKey = std::tuple<Timestamp, Side, Price>;

LevelKey level_key(const BookLevelRecord& level) {
    return LevelKey{level.event_time, level.side, level.price};
}

} // namespace

ParquetEventStore::ParquetEventStore(
    std::shared_ptr<arrow::fs::FileSystem> fs,
    const obr::config::StorageSettings& settings)
    : fs_(std::move(fs))
    , settings_(settings)
    , last_flush_time_(std::chrono::steady_clock::now()) {
}

ParquetEventStore::~ParquetEventStore() {
    std::lock_guard lock(mutex_);
    try {
        flush_locked();
    } catch (const StoreError& e) {
        std::cerr << "[parquet] Final flush failed, "
                  << raw_buffer_.size() << " raw messages and "
                  << level_buffer_.size() << " levels lost: " << e.what() << "\n";
    }
}

std::shared_ptr<arrow::fs::FileSystem> ParquetEventStore::make_local_fs(
    const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root_dir, /*recursive=*/true), "create " + root_dir);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

std::shared_ptr<arrow::fs::FileSystem> ParquetEventStore::make_s3_fs(
    const obr::config::StorageSettings& settings) {
    auto options = arrow::fs::S3Options::Defaults();
    options.region = settings.s3_region;
    options.scheme = settings.s3_scheme;
    if (!settings.s3_endpoint_override.empty()) {
        options.endpoint_override = settings.s3_endpoint_override;
    }

    auto s3fs = unwrap(arrow::fs::S3FileSystem::Make(options), "connect to S3");
    std::string base_path = settings.s3_bucket;
    if (!settings.s3_prefix.empty()) {
        base_path += "/" + settings.s3_prefix;
    }
    return std::make_shared<arrow::fs::SubTreeFileSystem>(base_path, s3fs);
}

// --- Write path ---

AppendAck ParquetEventStore::append(const RawMessageRecord& record) {
    if (record.symbol.empty()) {
        throw PermanentStoreError("Raw message has no symbol");
    }
    if (record.payload.empty()) {
        throw PermanentStoreError("Raw message has an empty payload");
    }

    std::lock_guard lock(mutex_);
    make_room_locked();
    raw_buffer_.push_back(record);
    maybe_flush();
    return AppendAck{record.symbol, record.key()};
}

void ParquetEventStore::upsert_levels(const std::vector<BookLevelRecord>& records) {
    if (records.empty()) return;

    std::lock_guard lock(mutex_);
    std::set<std::tuple<std::string, Timestamp, MessageKind>> verified;
    for (const auto& level : records) {
        auto parent = std::make_tuple(level.symbol, level.event_time, level.message_kind);
        if (verified.count(parent)) continue;
        if (!has_parent_locked(level)) {
            throw PermanentStoreError(
                "Book level for " + level.symbol + " at " + level.event_time.to_iso8601()
                + " has no matching raw message");
        }
        verified.insert(std::move(parent));
    }

    make_room_locked();
    level_buffer_.insert(level_buffer_.end(), records.begin(), records.end());
    maybe_flush();
}

bool ParquetEventStore::has_parent_locked(const BookLevelRecord& level) const {
    for (const auto& raw : raw_buffer_) {
        if (raw.symbol == level.symbol && raw.event_time == level.event_time
            && raw.message_kind == level.message_kind) {
            return true;
        }
    }

    // The parent may already have been flushed; look in its hour partition.
    const int64_t hour = hour_start(level.event_time);
    for (const auto& file : list_partition_files(raw_dir(level.symbol))) {
        if (file.hour_start_us != hour) continue;
        for (const auto& raw : read_raw_file(file.path)) {
            if (raw.event_time == level.event_time && raw.message_kind == level.message_kind) {
                return true;
            }
        }
    }
    return false;
}

// Once the backlog is full a record is only accepted after a successful
// flush. A failure here propagates before anything is buffered.
void ParquetEventStore::make_room_locked() {
    const size_t limit = kBacklogMultiple * static_cast<size_t>(std::max(1, settings_.write_buffer_size));
    if (raw_buffer_.size() + level_buffer_.size() < limit) return;
    flush_locked();
}

// Runs after a record was buffered, so a failure is not the caller's: the
// rows stay buffered and the flush is retried later.
void ParquetEventStore::maybe_flush() {
    size_t total = raw_buffer_.size() + level_buffer_.size();

    auto now = std::chrono::steady_clock::now();
    if (now < flush_retry_after_) return;
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - last_flush_time_).count();

    if (total >= static_cast<size_t>(settings_.write_buffer_size)
        || elapsed >= settings_.flush_interval_seconds) {
        try {
            flush_locked();
        } catch (const StoreError& e) {
            flush_retry_after_ = now + kFlushRetryDelay;
            std::cerr << "[parquet] Flush deferred, " << total
                      << " rows stay buffered: " << e.what() << "\n";
        }
    }
}

void ParquetEventStore::flush() {
    std::lock_guard lock(mutex_);
    flush_locked();
}

void ParquetEventStore::flush_locked() {
    // Raw first so a level file never lands on disk ahead of its parent.
    flush_raw();
    flush_levels();
    last_flush_time_ = std::chrono::steady_clock::now();
    flush_retry_after_ = {};
}

std::string ParquetEventStore::next_batch_id() {
    return std::to_string(Timestamp::now().microseconds()) + "-" + std::to_string(++batch_counter_);
}

void ParquetEventStore::flush_raw() {
    if (raw_buffer_.empty()) return;

    std::map<std::pair<std::string, int64_t>, std::vector<RawMessageRecord>> groups;
    for (const auto& record : raw_buffer_) {
        groups[{record.symbol, hour_start(record.event_time)}].push_back(record);
    }

    const std::string batch = next_batch_id();
    for (const auto& [group, records] : groups) {
        const auto& [symbol, hour] = group;
        auto [min_it, max_it] = std::minmax_element(records.begin(), records.end(),
            [](const auto& a, const auto& b) { return a.sequence_id < b.sequence_id; });

        std::string dir = raw_dir(symbol) + "/" + date_string(hour);
        check(fs_->CreateDir(dir, /*recursive=*/true), "create " + dir);

        std::string filename = "raw_" + hour_string(hour) + "_"
            + std::to_string(min_it->sequence_id) + "_"
            + std::to_string(max_it->sequence_id) + "_" + batch + ".parquet";
        write_raw_file(dir + "/" + filename, records);
    }
    raw_buffer_.clear();
}

void ParquetEventStore::flush_levels() {
    if (level_buffer_.empty()) return;

    std::map<std::pair<std::string, int64_t>, std::vector<BookLevelRecord>> groups;
    for (const auto& level : level_buffer_) {
        groups[{level.symbol, hour_start(level.event_time)}].push_back(level);
    }

    const std::string batch = next_batch_id();
    for (const auto& [group, records] : groups) {
        const auto& [symbol, hour] = group;
        std::string dir = levels_dir(symbol) + "/" + date_string(hour);
        check(fs_->CreateDir(dir, /*recursive=*/true), "create " + dir);
        write_levels_file(dir + "/levels_" + hour_string(hour) + "_" + batch + ".parquet", records);
    }
    level_buffer_.clear();
}

void ParquetEventStore::write_table(const std::string& path,
                                    const std::shared_ptr<arrow::Table>& table) {
    // Readers only pick up *.parquet, so a crash mid-write leaves no partial file behind.
    const std::string tmp = path + ".tmp";
    auto outfile = unwrap(fs_->OpenOutputStream(tmp), "open " + tmp);
    check(::parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                       std::max<int64_t>(1, table->num_rows())),
          "write " + tmp);
    check(outfile->Close(), "close " + tmp);
    check(fs_->Move(tmp, path), "rename " + tmp);
}

void ParquetEventStore::write_raw_file(const std::string& path,
                                       const std::vector<RawMessageRecord>& records) {
    write_table(path, unwrap(build_raw_table(records), "build raw table"));
}

void ParquetEventStore::write_levels_file(const std::string& path,
                                          const std::vector<BookLevelRecord>& records) {
    write_table(path, unwrap(build_levels_table(records), "build levels table"));
}

// --- Read path ---

std::vector<ParquetEventStore::PartitionFile> ParquetEventStore::list_partition_files(
    const std::string& dir) const {
    std::vector<PartitionFile> files;

    arrow::fs::FileSelector selector;
    selector.base_dir = dir;
    selector.allow_not_found = true;
    selector.recursive = true;
    auto listing = unwrap(fs_->GetFileInfo(selector), "list " + dir);

    for (const auto& info : listing) {
        if (info.type() != arrow::fs::FileType::File) continue;
        if (!ends_with(info.path(), ".parquet")) continue;

        // raw_<HH>_<first>_<last>_<batch> or levels_<HH>_<batch>
        auto parts = split(stem(info.path()), '_');
        PartitionFile file;
        file.path = info.path();
        try {
            int64_t day = Timestamp::from_iso8601(parent_name(info.path())).microseconds();
            if (parts.size() == 5 && parts[0] == "raw") {
                file.hour_start_us = day + std::stoll(parts[1]) * kMicrosPerHour;
                file.first_seq = std::stoull(parts[2]);
                file.last_seq = std::stoull(parts[3]);
                file.batch = batch_order(parts[4]);
            } else if (parts.size() == 3 && parts[0] == "levels") {
                file.hour_start_us = day + std::stoll(parts[1]) * kMicrosPerHour;
                file.batch = batch_order(parts[2]);
            } else {
                continue;
            }
        } catch (const std::logic_error& e) {
            std::cerr << "[parquet] Skipping unrecognized file " << info.path()
                      << ": " << e.what() << "\n";
            continue;
        }
        files.push_back(std::move(file));
    }

    std::sort(files.begin(), files.end(), [](const PartitionFile& a, const PartitionFile& b) {
        if (a.hour_start_us != b.hour_start_us) return a.hour_start_us < b.hour_start_us;
        return a.batch < b.batch;
    });
    return files;
}

std::shared_ptr<arrow::Table> ParquetEventStore::read_table(const std::string& path) const {
    auto infile = unwrap(fs_->OpenInputFile(path), "open " + path);

    std::unique_ptr<::parquet::arrow::FileReader> reader;
    try {
        reader = unwrap(::parquet::arrow::FileReader::Make(
            arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(infile)),
            "read " + path);
    } catch (const ::parquet::ParquetException& e) {
        throw PermanentStoreError("Corrupt parquet file " + path + ": " + e.what());
    }

    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "read " + path);
    return unwrap(table->CombineChunks(), "combine " + path);
}

std::vector<RawMessageRecord> ParquetEventStore::read_raw_file(const std::string& path) const {
    std::vector<RawMessageRecord> result;
    auto table = read_table(path);
    if (table->num_rows() == 0) return result;

    auto symbol_col = column<arrow::StringArray>(*table, "symbol");
    auto channel_col = column<arrow::StringArray>(*table, "channel");
    auto event_col = column<arrow::Int64Array>(*table, "event_time_us");
    auto received_col = column<arrow::Int64Array>(*table, "received_time_us");
    auto seq_col = column<arrow::UInt64Array>(*table, "sequence_id");
    auto kind_col = column<arrow::UInt8Array>(*table, "message_kind");
    auto checksum_col = column<arrow::Int64Array>(*table, "checksum");
    auto payload_col = column<arrow::StringArray>(*table, "payload");

    result.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        result.push_back(RawMessageRecord{
            Timestamp(event_col->Value(i)),
            Timestamp(received_col->Value(i)),
            channel_col->GetString(i),
            symbol_col->GetString(i),
            static_cast<MessageKind>(kind_col->Value(i)),
            checksum_col->IsNull(i) ? std::nullopt : std::optional<int64_t>(checksum_col->Value(i)),
            payload_col->GetString(i),
            seq_col->Value(i),
        });
    }
    return result;
}

std::vector<BookLevelRecord> ParquetEventStore::read_levels_file(const std::string& path) const {
    std::vector<BookLevelRecord> result;
    auto table = read_table(path);
    if (table->num_rows() == 0) return result;

    auto symbol_col = column<arrow::StringArray>(*table, "symbol");
    auto event_col = column<arrow::Int64Array>(*table, "event_time_us");
    auto side_col = column<arrow::UInt8Array>(*table, "side");
    auto price_col = column<arrow::DoubleArray>(*table, "price");
    auto quantity_col = column<arrow::DoubleArray>(*table, "quantity");
    auto kind_col = column<arrow::UInt8Array>(*table, "message_kind");
    auto checksum_col = column<arrow::Int64Array>(*table, "checksum");

    result.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        result.push_back(BookLevelRecord{
            Timestamp(event_col->Value(i)),
            symbol_col->GetString(i),
            static_cast<Side>(side_col->Value(i)),
            Price(price_col->Value(i)),
            Quantity(quantity_col->Value(i)),
            static_cast<MessageKind>(kind_col->Value(i)),
            checksum_col->IsNull(i) ? std::nullopt : std::optional<int64_t>(checksum_col->Value(i)),
        });
    }
    return result;
}

std::vector<RawMessageRecord> ParquetEventStore::read_raw(
    const std::string& symbol, const ScanRange& range, size_t limit) const {
    std::vector<RawMessageRecord> result;
    if (limit == 0) return result;

    auto in_range = [&range](const RawMessageRecord& r) {
        if (r.key() < range.from) return false;
        return !range.until || r.event_time <= *range.until;
    };

    // The buffer is copied before the directory is listed: a flush in
    // between shows its rows twice, which the key merge absorbs, and never
    // hides them. Listing happens outside the lock so appends are not held up.
    std::map<int64_t, std::vector<RawMessageRecord>> buffered;
    {
        std::lock_guard lock(mutex_);
        for (const auto& r : raw_buffer_) {
            if (r.symbol == symbol && in_range(r)) {
                buffered[hour_start(r.event_time)].push_back(r);
            }
        }
    }
    const auto files = list_partition_files(raw_dir(symbol));

    const int64_t from_hour = hour_start(range.from.event_time);
    const std::optional<int64_t> until_hour =
        range.until ? std::optional<int64_t>(hour_start(*range.until)) : std::nullopt;

    std::map<int64_t, std::vector<const PartitionFile*>> by_hour;
    for (const auto& file : files) {
        if (file.hour_start_us < from_hour) continue;
        if (until_hour && file.hour_start_us > *until_hour) continue;
        by_hour[file.hour_start_us].push_back(&file);
    }
    for (const auto& entry : buffered) {
        by_hour.try_emplace(entry.first);
    }

    // Hours are disjoint in event_time, so once `limit` records are collected
    // no later hour can contribute a smaller key.
    std::map<RecordKey, RawMessageRecord> merged;
    for (const auto& [hour, hour_files] : by_hour) {
        for (const auto* file : hour_files) {
            for (auto& r : read_raw_file(file->path)) {
                if (in_range(r)) merged.insert_or_assign(r.key(), std::move(r));
            }
        }
        if (auto it = buffered.find(hour); it != buffered.end()) {
            for (auto& r : it->second) merged.insert_or_assign(r.key(), std::move(r));
        }
        if (merged.size() >= limit) break;
    }

    for (auto& [key, record] : merged) {
        if (result.size() >= limit) break;
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<BookLevelRecord> ParquetEventStore::read_levels(
    const std::string& symbol, Timestamp from, std::optional<Timestamp> until) const {
    auto in_range = [&](const BookLevelRecord& l) {
        return l.event_time >= from && (!until || l.event_time <= *until);
    };

    // Buffer first, then listing, as in read_raw().
    std::vector<BookLevelRecord> buffered;
    {
        std::lock_guard lock(mutex_);
        for (const auto& l : level_buffer_) {
            if (l.symbol == symbol && in_range(l)) buffered.push_back(l);
        }
    }
    const auto files = list_partition_files(levels_dir(symbol));

    const int64_t from_hour = hour_start(from);
    std::map<LevelKey, BookLevelRecord> merged;
    for (const auto& file : files) {
        if (file.hour_start_us < from_hour) continue;
        if (until && file.hour_start_us > hour_start(*until)) continue;
        for (auto& l : read_levels_file(file.path)) {
            if (in_range(l)) merged.insert_or_assign(level_key(l), std::move(l));
        }
    }
    for (auto& l : buffered) {
        merged.insert_or_assign(level_key(l), std::move(l));
    }

    std::vector<BookLevelRecord> result;
    result.reserve(merged.size());
    for (auto& [key, level] : merged) {
        result.push_back(std::move(level));
    }
    return result;
}

std::vector<std::string> ParquetEventStore::symbols() const {
    std::set<std::string> found;
    {
        std::lock_guard lock(mutex_);
        for (const auto& r : raw_buffer_) {
            found.insert(r.symbol);
        }
    }

    arrow::fs::FileSelector selector;
    selector.base_dir = "raw";
    selector.allow_not_found = true;
    for (const auto& info : unwrap(fs_->GetFileInfo(selector), "list raw")) {
        if (info.type() == arrow::fs::FileType::Directory) {
            found.insert(decode_symbol(info.base_name()));
        }
    }
    return {found.begin(), found.end()};
}

std::optional<Timestamp> ParquetEventStore::latest_event_time(const std::string& symbol) const {
    std::optional<Timestamp> latest;
    {
        std::lock_guard lock(mutex_);
        for (const auto& r : raw_buffer_) {
            if (r.symbol == symbol && (!latest || r.event_time > *latest)) latest = r.event_time;
        }
    }
    const auto files = list_partition_files(raw_dir(symbol));
    if (files.empty()) return latest;

    // Files are sorted by hour; only the newest hour can hold the maximum.
    const int64_t newest_hour = files.back().hour_start_us;
    for (const auto& file : files) {
        if (file.hour_start_us != newest_hour) continue;
        for (const auto& r : read_raw_file(file.path)) {
            if (!latest || r.event_time > *latest) latest = r.event_time;
        }
    }
    return latest;
}

uint64_t ParquetEventStore::max_sequence_id() const {
    uint64_t max_seq = 0;
    {
        std::lock_guard lock(mutex_);
        for (const auto& r : raw_buffer_) {
            max_seq = std::max(max_seq, r.sequence_id);
        }
    }
    for (const auto& file : list_partition_files("raw")) {
        max_seq = std::max(max_seq, file.last_seq);
    }
    return max_seq;
}

StoreStats ParquetEventStore::stats() const {
    StoreStats s;
    for (const auto& symbol : symbols()) {
        uint64_t buffered_raw = 0, buffered_levels = 0;
        std::optional<Timestamp> first;
        {
            std::lock_guard lock(mutex_);
            for (const auto& r : raw_buffer_) {
                if (r.symbol != symbol) continue;
                ++buffered_raw;
                if (!first || r.event_time < *first) first = r.event_time;
            }
            for (const auto& l : level_buffer_) {
                if (l.symbol == symbol) ++buffered_levels;
            }
        }
        const auto raw_files = list_partition_files(raw_dir(symbol));
        const auto level_files = list_partition_files(levels_dir(symbol));

        // Row counts include rows later superseded by an identical key.
        s.raw_messages += buffered_raw;
        for (const auto& file : raw_files) {
            auto rows = read_raw_file(file.path);
            s.raw_messages += rows.size();
            if (file.hour_start_us == raw_files.front().hour_start_us) {
                for (const auto& r : rows) {
                    if (!first || r.event_time < *first) first = r.event_time;
                }
            }
        }
        s.book_levels += buffered_levels;
        for (const auto& file : level_files) {
            s.book_levels += read_levels_file(file.path).size();
        }

        auto last = latest_event_time(symbol);
        if (!first && !last) continue;
        ++s.symbols;
        if (first && (!s.first_event_time || *first < *s.first_event_time)) s.first_event_time = first;
        if (last && (!s.last_event_time || *last > *s.last_event_time)) s.last_event_time = last;
    }
    return s;
}

void ParquetEventStore::truncate() {
    std::lock_guard lock(mutex_);
    raw_buffer_.clear();
    level_buffer_.clear();

    for (const std::string dir : {"raw", "levels"}) {
        auto info = unwrap(fs_->GetFileInfo(dir), "stat " + dir);
        if (info.type() == arrow::fs::FileType::Directory) {
            check(fs_->DeleteDir(dir), "delete " + dir);
        }
    }
}

// --- Path helpers ---

std::string ParquetEventStore::encode_symbol(const std::string& symbol) {
    std::string encoded;
    for (char c : symbol) {
        if (c == '/') {
            encoded += "%2F";
        } else if (c == '%') {
            encoded += "%25";
        } else {
            encoded += c;
        }
    }
    return encoded;
}

std::string ParquetEventStore::decode_symbol(const std::string& encoded) {
    std::string symbol;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded.compare(i, 3, "%2F") == 0) {
            symbol += '/';
            i += 2;
        } else if (encoded.compare(i, 3, "%25") == 0) {
            symbol += '%';
            i += 2;
        } else {
            symbol += encoded[i];
        }
    }
    return symbol;
}

std::string ParquetEventStore::raw_dir(const std::string& symbol) {
    return "raw/" + encode_symbol(symbol);
}

std::string ParquetEventStore::levels_dir(const std::string& symbol) {
    return "levels/" + encode_symbol(symbol);
}

int64_t ParquetEventStore::hour_start(Timestamp t) {
    return (t.microseconds() / kMicrosPerHour) * kMicrosPerHour;
}

std::string ParquetEventStore::date_string(int64_t timestamp_us) {
    std::time_t time = static_cast<std::time_t>(timestamp_us / 1000000);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

std::string ParquetEventStore::hour_string(int64_t timestamp_us) {
    std::time_t time = static_cast<std::time_t>(timestamp_us / 1000000);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour;
    return oss.str();
}

} // namespace obr::repositories::pq
