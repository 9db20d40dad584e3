#include "config/Settings.hpp"
#include "infrastructure/MessageJson.hpp"
#include "services/MessagesStore.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    std::string import_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--import" && i + 1 < argc) {
            import_path = argv[++i];
        } else {
            std::cerr << "Usage: msgstore [--import messages.json]" << std::endl;
            std::cerr << "       Storage is configured through MSGSTORE_* variables." << std::endl;
            return 1;
        }
    }

    std::unique_ptr<msgstore::services::MessagesStore> store;
    try {
        auto settings = msgstore::config::Settings::from_environment();
        store = msgstore::services::MessagesStore::open(settings);
    } catch (const std::exception& e) {
        std::cerr << "[engine] " << e.what() << std::endl;
        return 1;
    }

    if (!import_path.empty()) {
        std::ifstream in(import_path);
        auto doc = nlohmann::json::parse(in, nullptr, false);
        if (!in || doc.is_discarded()) {
            std::cerr << "[engine] Cannot read " << import_path << std::endl;
            return 1;
        }
        try {
            for (const auto& message : msgstore::infrastructure::MessageJson::list_from_json(doc)) {
                store->insert(message);
            }
        } catch (const std::exception& e) {
            std::cerr << "[engine] Import failed: " << e.what() << std::endl;
            return 1;
        }
    }

    // Imported writes run before the first reload, so one line is printed.
    auto& messages = store->messages();
    auto observer = messages.add_observer(
        [](const msgstore::services::SnapshotRepository::Snapshot& snapshot) {
            std::cout << msgstore::infrastructure::MessageJson::to_json(*snapshot).dump()
                      << std::endl;
        });
    store->wait_idle();

    messages.remove_observer(observer);
    store->stop();

    auto stats = store->stats();
    std::cerr << "[stats] applied=" << stats.applied
              << " failed=" << stats.failed
              << " reloads=" << stats.reloads
              << " reload_failures=" << stats.reload_failures
              << std::endl;
    return (stats.failed == 0 && stats.reload_failures == 0) ? 0 : 2;
}
