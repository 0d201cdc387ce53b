#pragma once

#include <iostream>
#include <sqlite_modern_cpp.h>

#include "facefind_core/db/sqlite_error_utils.hpp"

namespace facefind_core {

// Rolls back on destruction unless commit() was reached. Face-set replacement
// uses an immediate transaction so two writers of the same photo serialize
// on BEGIN instead of failing at COMMIT.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, bool immediate = false)
      : db_(db), active_(true) {
    db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  bool is_active() const {
    return active_;
  }

  ~Transaction() noexcept {
    if (active_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception& e) {
        // SQLite already rolled back after an I/O or full-disk error
        std::cerr << "Transaction: " << format_db_error("rollback", e) << std::endl;
      }
    }
  }

 private:
  sqlite::database& db_;
  bool active_;
};

}  // namespace facefind_core
