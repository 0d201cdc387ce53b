#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace facefind_core {

class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

    // Blocks until a keyed connection is free.
    std::unique_ptr<sqlite::database> get_connection();

    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t available() const;

private:
    std::unique_ptr<sqlite::database> open_keyed_connection() const;

    bool shutting_down_ = false;
    std::string db_path_;
    std::string db_key_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace facefind_core
