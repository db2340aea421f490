#pragma once

#include "taskq/broker/store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace taskq {

// File-backed store shared by worker processes on one host. Every operation
// runs in one BEGIN IMMEDIATE transaction; conditional transitions check the
// current state in the UPDATE's WHERE clause.
class SqliteStore final : public QueueStore, public KeyValueStore {
public:
  explicit SqliteStore(std::string_view db_path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto enqueue(const Task& task) -> Result<void> override;
  [[nodiscard]] auto dequeue(std::string_view queue, TimePoint now,
                             TimePoint lease_until)
      -> Result<std::optional<Task>> override;
  [[nodiscard]] auto extend_lease(const Task& task, TimePoint lease_until)
      -> Result<void> override;
  [[nodiscard]] auto complete(const Task& task, TimePoint now,
                              std::chrono::milliseconds retention)
      -> Result<void> override;
  [[nodiscard]] auto retry(const Task& task) -> Result<void> override;
  [[nodiscard]] auto fail(const Task& task) -> Result<void> override;
  [[nodiscard]] auto requeue_failed(std::string_view queue,
                                    std::string_view id, TimePoint now)
      -> Result<Task> override;
  [[nodiscard]] auto delete_failed(std::string_view queue, std::string_view id)
      -> Result<void> override;
  [[nodiscard]] auto find(std::string_view queue, std::string_view id)
      -> Result<std::optional<Task>> override;
  [[nodiscard]] auto list(std::string_view queue, TaskFilter filter,
                          std::size_t offset, std::size_t limit)
      -> Result<std::vector<Task>> override;
  [[nodiscard]] auto counts(std::string_view queue, TimePoint now)
      -> Result<QueueCounts> override;
  [[nodiscard]] auto recover_expired(TimePoint now)
      -> Result<std::vector<Task>> override;
  [[nodiscard]] auto purge_completed(TimePoint now)
      -> Result<std::size_t> override;

  [[nodiscard]] auto set_if_absent(std::string_view key, const Bytes& value,
                                   std::chrono::milliseconds ttl)
      -> Result<bool> override;
  [[nodiscard]] auto set(std::string_view key, const Bytes& value,
                         std::chrono::milliseconds ttl) -> Result<void> override;
  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<Bytes>> override;
  [[nodiscard]] auto erase(std::string_view key) -> Result<void> override;
  [[nodiscard]] auto erase_if(std::string_view key, const Bytes& expected)
      -> Result<bool> override;
  [[nodiscard]] auto purge_expired() -> Result<std::size_t> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto changes() const noexcept -> int;
  [[nodiscard]] auto bump_counters(std::string_view queue, int failed)
      -> Result<void>;
  [[nodiscard]] auto set_retry_or_fail(const Task& task, TaskState state)
      -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  // Rolls back on destruction unless committed.
  class Transaction {
  public:
    explicit Transaction(SqliteStore& store) noexcept : store_(store) {
    }
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] auto begin() -> Result<void>;
    [[nodiscard]] auto commit() -> Result<void>;

  private:
    SqliteStore& store_;
    bool active_{false};
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
  std::mutex mu_;
};

}  // namespace taskq
