#pragma once
#include "facefind_core/db/database_manager.hpp"
#include "facefind_core/db/sqlite_error_utils.hpp"
#include <sqlite_modern_cpp.h>
#include <memory>
#include <stdexcept>

namespace facefind_core {

// Borrows one connection of the local store for the lifetime of the guard.
// A pool that is shut down or never initialized means the local tier is
// gone for every caller, so the failure is reported as a CantOpen outage.
class PooledConnection {
public:
    explicit PooledConnection(DatabaseManager& manager) : manager_(manager) {
        try {
            conn_ = manager.get_connection();
        } catch (const std::runtime_error& e) {
            throw LocalStoreError(std::string("Local store unavailable: ") + e.what(),
                                  DbErrorKind::CantOpen);
        }
        if (!conn_) {
            throw LocalStoreError("Local store unavailable: no connection returned",
                                  DbErrorKind::CantOpen);
        }
    }
    // Hands the connection back to the pool
    ~PooledConnection() {
        if (conn_) {
            manager_.return_connection(std::move(conn_));
        }
    }

    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

private:
    DatabaseManager& manager_;
    std::unique_ptr<sqlite::database> conn_;
};
}  // namespace facefind_core
