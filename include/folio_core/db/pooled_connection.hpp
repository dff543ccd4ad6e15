#pragma once

#include <memory>
#include <stdexcept>
#include <utility>

#include <sqlite_modern_cpp.h>

#include "folio_core/db/database_manager.hpp"

namespace folio_core {

/**
 * @brief Scoped checkout of one connection from the chunk database pool.
 *
 * The connection goes back to the pool when the guard is released or
 * destroyed, whichever comes first. A guard can be moved into a helper that
 * finishes the statement; the moved-from guard holds nothing.
 */
class PooledConnection {
 public:
  // Blocks while every pooled connection is checked out
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(&manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw std::runtime_error("No chunk database connection available: the pool is shutting down");
    }
  }

  PooledConnection(PooledConnection&& other) noexcept
      : manager_(other.manager_), conn_(std::move(other.conn_)) {}

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;
  PooledConnection& operator=(PooledConnection&&) = delete;

  ~PooledConnection() {
    release();
  }

  // Hands the connection back before the end of the scope
  void release() {
    if (conn_) {
      manager_->return_connection(std::move(conn_));
    }
  }

  bool holds_connection() const {
    return conn_ != nullptr;
  }

  sqlite::database* operator->() const {
    return &checked();
  }
  sqlite::database& operator*() const {
    return checked();
  }

 private:
  sqlite::database& checked() const {
    if (!conn_) {
      throw std::logic_error("PooledConnection used after its connection was released");
    }
    return *conn_;
  }

  DatabaseManager* manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace folio_core
