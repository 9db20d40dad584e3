#include "config/Settings.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace msgstore::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "1" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "no") return false;
    return fallback;
}

Settings preset(const std::string& env) {
    return (env == "production") ? Settings::production() : Settings::development();
}

void overlay(Settings& s, const nlohmann::json& doc) {
    if (doc.contains("storage")) {
        const auto& storage = doc["storage"];
        s.storage.backend = storage.value("backend", s.storage.backend);
        s.storage.database_path = storage.value("database_path", s.storage.database_path);
        s.storage.data_directory = storage.value("data_directory", s.storage.data_directory);
    }
    if (doc.contains("session")) {
        s.session.current_user_id =
            doc["session"].value("current_user_id", s.session.current_user_id);
    }
    if (doc.contains("log")) {
        s.log.verbose = doc["log"].value("verbose", s.log.verbose);
    }
}

} // namespace

Settings Settings::from_environment() {
    auto config_file = env_or("MSGSTORE_CONFIG_FILE", "");
    Settings s = config_file.empty() ? preset(env_or("MSGSTORE_ENV", "development"))
                                     : from_file(config_file);
    s.storage.backend = env_or("MSGSTORE_STORAGE_BACKEND", s.storage.backend);
    s.storage.database_path = env_or("MSGSTORE_DATABASE_PATH", s.storage.database_path);
    s.storage.data_directory = env_or("MSGSTORE_DATA_DIRECTORY", s.storage.data_directory);
    s.session.current_user_id = env_or("MSGSTORE_CURRENT_USER_ID", s.session.current_user_id);
    s.log.verbose = env_bool_or("MSGSTORE_VERBOSE", s.log.verbose);
    return s;
}

Settings Settings::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("Config file is not a JSON object: " + path);
    }

    try {
        Settings s = preset(doc.value("env", std::string("development")));
        overlay(s, doc);
        return s;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

Settings Settings::development() {
    Settings s;
    s.storage.backend = "memory";
    s.storage.database_path = "data/dev/msgstore.db";
    s.storage.data_directory = "data/dev";
    s.log.verbose = true;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.storage.backend = "sqlite";
    s.storage.database_path = "data/prod/msgstore.db";
    s.storage.data_directory = "data/prod";
    s.log.verbose = false;
    return s;
}

} // namespace msgstore::config
