#pragma once

#include <string>
#include <vector>

namespace obr::config {

struct FeedSettings {
    std::string url = "wss://ws.kraken.com/v2";
    std::vector<std::string> symbols{"BTC/USD"};
    int book_depth = 10;
    int ping_interval_seconds = 30;
};

struct StorageSettings {
    std::string backend = "memory";       // "memory", "parquet", or "s3"
    std::string data_directory = "data";
    int write_buffer_size = 1024;
    int flush_interval_seconds = 30;
    // S3-compatible storage (AWS S3, Cloudflare R2, Backblaze B2, Wasabi, MinIO)
    std::string s3_bucket;
    std::string s3_prefix = "obr";
    std::string s3_region = "us-east-1";
    std::string s3_endpoint_override;     // non-empty for R2/B2/Wasabi/MinIO
    std::string s3_scheme = "https";      // "http" for local MinIO
};

struct IngestSettings {
    int queue_capacity = 10000;
    std::string overflow_policy = "drop_oldest";   // "drop_oldest" or "block"
    int max_write_attempts = 5;
    int initial_backoff_ms = 50;
    int max_backoff_ms = 2000;
    std::string event_time_source = "embedded";    // "embedded" or "ingest"
};

struct ReplaySettings {
    std::string host = "0.0.0.0";
    int http_port = 8080;
    int ws_port = 8081;
    int scan_batch_size = 500;
    std::string pacing = "none";                   // "none" or "realtime"
    double pacing_speed = 1.0;
    int max_pacing_delay_seconds = 60;
    int search_horizon_seconds = 0;                // 0 = up to the latest record
    int max_send_buffer_kb = 1024;                 // per client, unsent bytes before sends wait
};

struct ServiceSettings {
    std::string mode = "all";                      // "capture", "replay", or "all"
    int stats_interval_seconds = 10;
};

struct Settings {
    FeedSettings feed;
    StorageSettings storage;
    IngestSettings ingest;
    ReplaySettings replay;
    ServiceSettings service;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace obr::config
