#pragma once

#include "facefind_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace facefind_core {

/**
 * @class DatabaseManager
 * @brief Owns the encrypted local database: schema setup and the connection pool.
 *
 * One database file holds the cache manifest, the local embedding tier and
 * the folder snapshots. Repositories borrow connections through PooledConnection.
 */
class DatabaseManager {
public:
    static DatabaseManager& get_instance();

    // Must be called once at application startup
    void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

    // Used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const {
        return is_initialized_;
    }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    DatabaseManager() = default;
    void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace facefind_core
