#pragma once

#include <string>

namespace msgstore::config {

struct StorageSettings {
    std::string backend = "memory";       // "memory", "sqlite", or "parquet"
    std::string database_path = "msgstore.db";
    std::string data_directory = "data";  // parquet table files
};

struct SessionSettings {
    // Messages addressed to this user are classified as inbound.
    std::string current_user_id;
};

struct LogSettings {
    bool verbose = true;
};

struct Settings {
    StorageSettings storage;
    SessionSettings session;
    LogSettings log;

    // Preset chosen by MSGSTORE_ENV, overlaid with MSGSTORE_CONFIG_FILE if set,
    // then with the individual MSGSTORE_* variables.
    static Settings from_environment();
    // Preset named by the document's "env" key, overlaid with its sections.
    // Throws std::runtime_error if the file cannot be read or parsed.
    static Settings from_file(const std::string& path);
    static Settings development();
    static Settings production();
};

} // namespace msgstore::config
