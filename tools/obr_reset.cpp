#include "config/Settings.hpp"
#include "repositories/StoreHandle.hpp"

#include <iostream>

int main() {
    auto settings = obr::config::Settings::from_environment();

    try {
        auto handle = obr::repositories::StoreHandle::open(settings.storage);
        auto& store = handle.store();

        std::cout << "Resetting order book store (" << settings.storage.backend << ")..." << std::endl;
        store.truncate();

        auto stats = store.stats();
        std::cout << "raw messages: " << stats.raw_messages << "\n"
                  << "book levels:  " << stats.book_levels << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[reset] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Store reset complete. Capture can start fresh." << std::endl;
    return 0;
}
