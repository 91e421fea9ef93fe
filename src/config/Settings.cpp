#include "config/Settings.hpp"

#include <cstdlib>
#include <sstream>

namespace obr::config {

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
    } catch (const std::exception&) {
        return fallback;
    }
}

double env_double_or(const char* name, double fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> env_list_or(const char* name, const std::vector<std::string>& fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::vector<std::string> items;
    std::istringstream stream(val);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) items.push_back(item);
    }
    return items.empty() ? fallback : items;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("OBR_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    s.feed.url = env_or("OBR_FEED_URL", s.feed.url);
    s.feed.symbols = env_list_or("OBR_SYMBOLS", s.feed.symbols);
    s.feed.book_depth = env_int_or("OBR_BOOK_DEPTH", s.feed.book_depth);
    s.feed.ping_interval_seconds = env_int_or("OBR_PING_INTERVAL", s.feed.ping_interval_seconds);

    s.storage.backend = env_or("OBR_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("OBR_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.write_buffer_size = env_int_or("OBR_WRITE_BUFFER_SIZE", s.storage.write_buffer_size);
    s.storage.flush_interval_seconds = env_int_or("OBR_FLUSH_INTERVAL", s.storage.flush_interval_seconds);
    s.storage.s3_bucket = env_or("OBR_S3_BUCKET", s.storage.s3_bucket);
    s.storage.s3_prefix = env_or("OBR_S3_PREFIX", s.storage.s3_prefix);
    s.storage.s3_region = env_or("OBR_S3_REGION", s.storage.s3_region);
    s.storage.s3_endpoint_override = env_or("OBR_S3_ENDPOINT", s.storage.s3_endpoint_override);
    s.storage.s3_scheme = env_or("OBR_S3_SCHEME", s.storage.s3_scheme);

    s.ingest.queue_capacity = env_int_or("OBR_QUEUE_CAPACITY", s.ingest.queue_capacity);
    s.ingest.overflow_policy = env_or("OBR_OVERFLOW_POLICY", s.ingest.overflow_policy);
    s.ingest.max_write_attempts = env_int_or("OBR_MAX_WRITE_ATTEMPTS", s.ingest.max_write_attempts);
    s.ingest.initial_backoff_ms = env_int_or("OBR_INITIAL_BACKOFF_MS", s.ingest.initial_backoff_ms);
    s.ingest.max_backoff_ms = env_int_or("OBR_MAX_BACKOFF_MS", s.ingest.max_backoff_ms);
    s.ingest.event_time_source = env_or("OBR_EVENT_TIME_SOURCE", s.ingest.event_time_source);

    s.replay.host = env_or("OBR_HOST", s.replay.host);
    s.replay.http_port = env_int_or("OBR_HTTP_PORT", s.replay.http_port);
    s.replay.ws_port = env_int_or("OBR_WS_PORT", s.replay.ws_port);
    s.replay.scan_batch_size = env_int_or("OBR_SCAN_BATCH_SIZE", s.replay.scan_batch_size);
    s.replay.pacing = env_or("OBR_PACING", s.replay.pacing);
    s.replay.pacing_speed = env_double_or("OBR_PACING_SPEED", s.replay.pacing_speed);
    s.replay.max_pacing_delay_seconds = env_int_or("OBR_MAX_PACING_DELAY", s.replay.max_pacing_delay_seconds);
    s.replay.search_horizon_seconds = env_int_or("OBR_SEARCH_HORIZON", s.replay.search_horizon_seconds);
    s.replay.max_send_buffer_kb = env_int_or("OBR_MAX_SEND_BUFFER_KB", s.replay.max_send_buffer_kb);

    s.service.mode = env_or("OBR_MODE", s.service.mode);
    s.service.stats_interval_seconds = env_int_or("OBR_STATS_INTERVAL", s.service.stats_interval_seconds);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.feed.ping_interval_seconds = 30;
    s.storage.data_directory = "data/dev";
    s.service.stats_interval_seconds = 10;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.feed.ping_interval_seconds = 15;
    s.storage.backend = "parquet";
    s.storage.data_directory = "data/prod";
    s.storage.write_buffer_size = 4096;
    s.storage.flush_interval_seconds = 10;
    s.ingest.queue_capacity = 65536;
    s.service.stats_interval_seconds = 60;
    return s;
}

} // namespace obr::config
