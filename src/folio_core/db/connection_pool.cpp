#include "folio_core/db/connection_pool.hpp"

#include <stdexcept>

namespace folio_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size) : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be positive");
  }
  for (int i = 0; i < pool_size; ++i) {
    auto db = std::make_unique<sqlite::database>(db_path_);
    if (!db->connection()) {
      throw std::runtime_error("Failed to open connection for pool: " + db_path_);
    }

    *db << "PRAGMA foreign_keys = ON;";
    *db << "PRAGMA busy_timeout = 5000;";

    pool_.push(std::move(db));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  // Wait until a connection is available or shutdown is requested
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_ && conn) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace folio_core
