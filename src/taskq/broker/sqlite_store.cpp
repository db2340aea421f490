#include "taskq/broker/sqlite_store.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/task/state_strings.hpp"
#include "taskq/util/log.hpp"

#include <sqlite3.h>

#include <string>

namespace taskq {

namespace {

// Column order shared by every SELECT that reads a whole task.
constexpr const char* kTaskColumns =
    "id, queue, type, payload, state, retry_count, max_retry, timeout_ms, "
    "enqueued_at, process_at, processed_at, last_failed_at, last_error";

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_blob(sqlite3_stmt* stmt, int col) -> Bytes {
  auto* p = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, col));
  int n = sqlite3_column_bytes(stmt, col);
  return p ? Bytes(p, p + n) : Bytes{};
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view s) -> void {
  sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()),
                    SQLITE_TRANSIENT);
}

auto bind_blob(sqlite3_stmt* stmt, int idx, const Bytes& b) -> void {
  sqlite3_bind_blob(stmt, idx, b.data(), static_cast<int>(b.size()),
                    SQLITE_TRANSIENT);
}

auto bind_time(sqlite3_stmt* stmt, int idx, TimePoint tp) -> void {
  sqlite3_bind_int64(stmt, idx, tp == TimePoint{} ? 0 : to_unix_ms(tp));
}

auto col_time(sqlite3_stmt* stmt, int col) -> TimePoint {
  auto ms = sqlite3_column_int64(stmt, col);
  return ms == 0 ? TimePoint{} : from_unix_ms(ms);
}

auto read_task(sqlite3_stmt* stmt) -> Task {
  Task t;
  t.id = TaskId{col_text(stmt, 0)};
  t.queue = col_text(stmt, 1);
  t.type = col_text(stmt, 2);
  t.payload = col_blob(stmt, 3);
  t.state = parse_task_state(col_text(stmt, 4));
  t.retry_count = sqlite3_column_int(stmt, 5);
  t.max_retry = sqlite3_column_int(stmt, 6);
  t.timeout = std::chrono::milliseconds(sqlite3_column_int64(stmt, 7));
  t.enqueued_at = col_time(stmt, 8);
  t.process_at = col_time(stmt, 9);
  t.processed_at = col_time(stmt, 10);
  t.last_failed_at = col_time(stmt, 11);
  t.last_error = col_text(stmt, 12);
  return t;
}

}  // namespace

auto SqliteStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteStore::Statement::~Statement() {
  reset();
}

auto SqliteStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteStore::Transaction::~Transaction() {
  if (active_) {
    if (auto r = store_.execute("ROLLBACK;"); !r) {
      log::warn("Rollback failed: {}", r.error().message());
    }
  }
}

auto SqliteStore::Transaction::begin() -> Result<void> {
  auto r = store_.execute("BEGIN IMMEDIATE;");
  active_ = r.has_value();
  return r;
}

auto SqliteStore::Transaction::commit() -> Result<void> {
  auto r = store_.execute("COMMIT;");
  if (r) {
    active_ = false;
  }
  return r;
}

auto SqliteStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return taskq::fail(Error::DatabaseError);
  }
  return stmt;
}

auto SqliteStore::changes() const noexcept -> int {
  return sqlite3_changes(db_.get());
}

SqliteStore::SqliteStore(std::string_view db_path) : db_path_(db_path) {
}

SqliteStore::~SqliteStore() {
  close();
}

auto SqliteStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(
      db_path_.c_str(), &raw_db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return taskq::fail(Error::DatabaseError);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(),
                       static_cast<int>(timing::kSqliteBusyTimeout.count()));

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto SqliteStore::close() -> void {
  db_.reset();
}

auto SqliteStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      queue TEXT NOT NULL,
      type TEXT NOT NULL,
      payload BLOB,
      state TEXT NOT NULL DEFAULT 'pending',
      retry_count INTEGER NOT NULL DEFAULT 0,
      max_retry INTEGER NOT NULL DEFAULT 0,
      timeout_ms INTEGER NOT NULL DEFAULT 0,
      enqueued_at INTEGER NOT NULL,
      process_at INTEGER NOT NULL,
      processed_at INTEGER DEFAULT 0,
      last_failed_at INTEGER DEFAULT 0,
      last_error TEXT DEFAULT '',
      seq INTEGER NOT NULL,
      lease_until INTEGER DEFAULT 0,
      expires_at INTEGER DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_ready
      ON tasks(queue, state, process_at, seq);

    CREATE TABLE IF NOT EXISTS queue_counters (
      queue TEXT PRIMARY KEY,
      processed INTEGER NOT NULL DEFAULT 0,
      failed_total INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS kv (
      key TEXT PRIMARY KEY,
      value BLOB,
      expires_at INTEGER NOT NULL
    );
  )";

  return execute(sql);
}

auto SqliteStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errmsg(db_.get()));
    sqlite3_free(err_msg);
    return taskq::fail(Error::DatabaseError);
  }
  return ok();
}

auto SqliteStore::bump_counters(std::string_view queue, int failed)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO queue_counters (queue, processed, failed_total)
    VALUES (?, 1, ?)
    ON CONFLICT(queue) DO UPDATE SET
      processed = processed + 1,
      failed_total = failed_total + excluded.failed_total;
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, queue);
  sqlite3_bind_int(stmt.get(), 2, failed);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to update counters: {}", sqlite3_errmsg(db_.get()));
    return taskq::fail(Error::DatabaseError);
  }
  return ok();
}

auto SqliteStore::enqueue(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  Transaction tx(*this);
  if (auto r = tx.begin(); !r)
    return r;

  constexpr auto sql = R"(
    INSERT INTO tasks (id, queue, type, payload, state, retry_count, max_retry,
                       timeout_ms, enqueued_at, process_at, seq)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?,
            (SELECT COALESCE(MAX(seq), 0) + 1 FROM tasks));
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task.id.value());
  bind_text(stmt.get(), 2, task.queue);
  bind_text(stmt.get(), 3, task.type);
  bind_blob(stmt.get(), 4, task.payload);
  bind_text(stmt.get(), 5, task_state_name(task.state));
  sqlite3_bind_int(stmt.get(), 6, task.retry_count);
  sqlite3_bind_int(stmt.get(), 7, task.max_retry);
  sqlite3_bind_int64(stmt.get(), 8, task.timeout.count());
  bind_time(stmt.get(), 9, task.enqueued_at);
  bind_time(stmt.get(), 10, task.process_at);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    return taskq::fail(Error::AlreadyExists);
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to enqueue task {}: {}", task.id,
               sqlite3_errmsg(db_.get()));
    return taskq::fail(Error::DatabaseError);
  }
  return tx.commit();
}

auto SqliteStore::dequeue(std::string_view queue, TimePoint now,
                          TimePoint lease_until)
    -> Result<std::optional<Task>> {
  std::lock_guard lock(mu_);
  Transaction tx(*this);
  if (auto r = tx.begin(); !r)
    return std::unexpected(r.error());

  auto select_sql = std::string("SELECT ") + kTaskColumns + R"(
    FROM tasks
    WHERE queue = ? AND state IN ('pending', 'scheduled', 'retry')
      AND process_at <= ?
    ORDER BY process_at, seq
    LIMIT 1;
  )";
  auto result = prepare(select_sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement select(*result);
  bind_text(select.get(), 1, queue);
  sqlite3_bind_int64(select.get(), 2, to_unix_ms(now));

  int rc = sqlite3_step(select.get());
  if (rc == SQLITE_DONE) {
    return std::optional<Task>{};
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to dequeue from '{}': {}", queue,
               sqlite3_errmsg(db_.get()));
    return taskq::fail(Error::DatabaseError);
  }
  Task task = read_task(select.get());
  select.reset();

  constexpr auto update_sql = R"(
    UPDATE tasks SET state = 'active', lease_until = ? WHERE id = ?;
  )";
  auto upd = prepare(update_sql);
  if (!upd)
    return std::unexpected(upd.error());
  Statement update(*upd);
  bind_time(update.get(), 1, lease_until);
  bind_text(update.get(), 2, task.id.value());
  if (sqlite3_step(update.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  if (auto r = tx.commit(); !r)
    return std::unexpected(r.error());

  task.state = TaskState::Active;
  return std::optional<Task>{std::move(task)};
}

auto SqliteStore::extend_lease(const Task& task, TimePoint lease_until)
    -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    UPDATE tasks SET lease_until = ?
    WHERE id = ? AND queue = ? AND state = 'active';
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_time(stmt.get(), 1, lease_until);
  bind_text(stmt.get(), 2, task.id.value());
  bind_text(stmt.get(), 3, task.queue);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  if (changes() != 1) {
    return taskq::fail(Error::TaskNotFound);
  }
  return ok();
}

auto SqliteStore::complete(const Task& task, TimePoint now,
                           std::chrono::milliseconds retention)
    -> Result<void> {
  std::lock_guard lock(mu_);
  Transaction tx(*this);
  if (auto r = tx.begin(); !r)
    return r;

  const char* sql =
      retention.count() <= 0
          ? "DELETE FROM tasks WHERE id = ? AND queue = ? AND state = 'active';"
          : R"(UPDATE tasks SET state = 'completed', processed_at = ?,
                 expires_at = ?, lease_until = 0
               WHERE id = ? AND queue = ? AND state = 'active';)";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  int idx = 1;
  if (retention.count() > 0) {
    bind_time(stmt.get(), idx++, now);
    bind_time(stmt.get(), idx++, now + retention);
  }
  bind_text(stmt.get(), idx++, task.id.value());
  bind_text(stmt.get(), idx, task.queue);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  if (changes() != 1) {
    return taskq::fail(Error::TaskNotFound);
  }
  if (auto r = bump_counters(task.queue, 0); !r)
    return r;
  return tx.commit();
}

auto SqliteStore::set_retry_or_fail(const Task& task, TaskState state)
    -> Result<void> {
  Transaction tx(*this);
  if (auto r = tx.begin(); !r)
    return r;

  constexpr auto sql = R"(
    UPDATE tasks SET state = ?, retry_count = ?, process_at = ?,
      last_error = ?, last_failed_at = ?, lease_until = 0,
      seq = (SELECT COALESCE(MAX(seq), 0) + 1 FROM tasks)
    WHERE id = ? AND queue = ? AND state = 'active';
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, task_state_name(state));
  sqlite3_bind_int(stmt.get(), 2, task.retry_count);
  bind_time(stmt.get(), 3, task.process_at);
  bind_text(stmt.get(), 4, task.last_error);
  bind_time(stmt.get(), 5, task.last_failed_at);
  bind_text(stmt.get(), 6, task.id.value());
  bind_text(stmt.get(), 7, task.queue);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to move task {} to {}: {}", task.id,
               task_state_name(state), sqlite3_errmsg(db_.get()));
    return taskq::fail(Error::DatabaseError);
  }
  if (changes() != 1) {
    return taskq::fail(Error::TaskNotFound);
  }
  if (auto r = bump_counters(task.queue, 1); !r)
    return r;
  return tx.commit();
}

auto SqliteStore::retry(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  return set_retry_or_fail(task, TaskState::Retry);
}

auto SqliteStore::fail(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  return set_retry_or_fail(task, TaskState::Failed);
}

auto SqliteStore::requeue_failed(std::string_view queue, std::string_view id,
                                 TimePoint now) -> Result<Task> {
  std::lock_guard lock(mu_);
  Transaction tx(*this);
  if (auto r = tx.begin(); !r)
    return std::unexpected(r.error());

  constexpr auto sql = R"(
    UPDATE tasks SET state = 'pending', retry_count = 0, last_error = '',
      process_at = ?, seq = (SELECT COALESCE(MAX(seq), 0) + 1 FROM tasks)
    WHERE id = ? AND queue = ? AND state = 'failed';
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_time(stmt.get(), 1, now);
  bind_text(stmt.get(), 2, id);
  bind_text(stmt.get(), 3, queue);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  if (changes() != 1) {
    return taskq::fail(Error::TaskNotFound);
  }
  stmt.reset();

  auto select_sql =
      std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id = ?;";
  auto sel = prepare(select_sql.c_str());
  if (!sel)
    return std::unexpected(sel.error());
  Statement select(*sel);
  bind_text(select.get(), 1, id);
  if (sqlite3_step(select.get()) != SQLITE_ROW) {
    return taskq::fail(Error::DatabaseError);
  }
  Task task = read_task(select.get());
  select.reset();

  if (auto r = tx.commit(); !r)
    return std::unexpected(r.error());
  return task;
}

auto SqliteStore::delete_failed(std::string_view queue, std::string_view id)
    -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql =
      "DELETE FROM tasks WHERE id = ? AND queue = ? AND state = 'failed';";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, id);
  bind_text(stmt.get(), 2, queue);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  if (changes() != 1) {
    return taskq::fail(Error::TaskNotFound);
  }
  return ok();
}

auto SqliteStore::find(std::string_view queue, std::string_view id)
    -> Result<std::optional<Task>> {
  std::lock_guard lock(mu_);
  auto sql = std::string("SELECT ") + kTaskColumns +
             " FROM tasks WHERE id = ? AND queue = ?;";
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, id);
  bind_text(stmt.get(), 2, queue);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::optional<Task>{};
  }
  if (rc != SQLITE_ROW) {
    return taskq::fail(Error::DatabaseError);
  }
  return std::optional<Task>{read_task(stmt.get())};
}

auto SqliteStore::list(std::string_view queue, TaskFilter filter,
                       std::size_t offset, std::size_t limit)
    -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  auto sql = std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE queue = ? ";
  if (filter == TaskFilter::Failed) {
    sql += "AND state = 'failed' ORDER BY last_failed_at DESC, seq ";
  } else {
    sql += "AND state IN ('pending', 'scheduled', 'retry', 'active') "
           "ORDER BY process_at, seq ";
  }
  sql += "LIMIT ? OFFSET ?;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, queue);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(offset));

  std::vector<Task> tasks;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    tasks.push_back(read_task(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return tasks;
}

auto SqliteStore::counts(std::string_view queue, TimePoint now)
    -> Result<QueueCounts> {
  std::lock_guard lock(mu_);
  QueueCounts c;

  // Scheduled tasks whose time has passed count as pending.
  constexpr auto state_sql = R"(
    SELECT CASE WHEN state = 'scheduled' AND process_at <= ? THEN 'pending'
                ELSE state END AS s,
           COUNT(*)
    FROM tasks WHERE queue = ? GROUP BY s;
  )";
  auto result = prepare(state_sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_int64(stmt.get(), 1, to_unix_ms(now));
  bind_text(stmt.get(), 2, queue);
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto n = sqlite3_column_int64(stmt.get(), 1);
    switch (parse_task_state(col_text(stmt.get(), 0))) {
      case TaskState::Pending: c.pending += n; break;
      case TaskState::Scheduled: c.scheduled += n; break;
      case TaskState::Active: c.active += n; break;
      case TaskState::Retry: c.retry += n; break;
      case TaskState::Completed: c.completed += n; break;
      case TaskState::Failed: c.failed += n; break;
    }
  }
  if (rc != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  stmt.reset();

  auto ctr = prepare(
      "SELECT processed, failed_total FROM queue_counters WHERE queue = ?;");
  if (!ctr)
    return std::unexpected(ctr.error());
  Statement counters(*ctr);
  bind_text(counters.get(), 1, queue);
  rc = sqlite3_step(counters.get());
  if (rc == SQLITE_ROW) {
    c.processed = sqlite3_column_int64(counters.get(), 0);
    c.failed_total = sqlite3_column_int64(counters.get(), 1);
  } else if (rc != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return c;
}

auto SqliteStore::recover_expired(TimePoint now) -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  Transaction tx(*this);
  if (auto r = tx.begin(); !r)
    return std::unexpected(r.error());

  auto select_sql = std::string("SELECT ") + kTaskColumns +
                    " FROM tasks WHERE state = 'active' AND lease_until <= ?;";
  auto result = prepare(select_sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement select(*result);
  sqlite3_bind_int64(select.get(), 1, to_unix_ms(now));

  std::vector<Task> expired;
  int rc;
  while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
    expired.push_back(read_task(select.get()));
  }
  if (rc != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  select.reset();

  for (auto& task : expired) {
    task.last_error = "lease expired: worker lost while processing";
    task.last_failed_at = now;
    if (task.retry_count < task.max_retry) {
      ++task.retry_count;
      task.state = TaskState::Retry;
      task.process_at = now;
    } else {
      task.state = TaskState::Failed;
    }

    constexpr auto sql = R"(
      UPDATE tasks SET state = ?, retry_count = ?, process_at = ?,
        last_error = ?, last_failed_at = ?, lease_until = 0,
        seq = (SELECT COALESCE(MAX(seq), 0) + 1 FROM tasks)
      WHERE id = ?;
    )";
    auto upd = prepare(sql);
    if (!upd)
      return std::unexpected(upd.error());
    Statement stmt(*upd);
    bind_text(stmt.get(), 1, task_state_name(task.state));
    sqlite3_bind_int(stmt.get(), 2, task.retry_count);
    bind_time(stmt.get(), 3, task.process_at);
    bind_text(stmt.get(), 4, task.last_error);
    bind_time(stmt.get(), 5, task.last_failed_at);
    bind_text(stmt.get(), 6, task.id.value());
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return taskq::fail(Error::DatabaseError);
    }
    if (auto r = bump_counters(task.queue, 1); !r)
      return std::unexpected(r.error());
  }

  if (auto r = tx.commit(); !r)
    return std::unexpected(r.error());
  return expired;
}

auto SqliteStore::purge_completed(TimePoint now) -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto result =
      prepare("DELETE FROM tasks WHERE state = 'completed' AND expires_at <= ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_int64(stmt.get(), 1, to_unix_ms(now));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return static_cast<std::size_t>(changes());
}

auto SqliteStore::set_if_absent(std::string_view key, const Bytes& value,
                                std::chrono::milliseconds ttl) -> Result<bool> {
  std::lock_guard lock(mu_);
  auto now = Clock::now();
  // Replaces an expired holder; a live one makes the insert a no-op.
  constexpr auto sql = R"(
    INSERT INTO kv (key, value, expires_at) VALUES (?, ?, ?)
    ON CONFLICT(key) DO UPDATE SET
      value = excluded.value,
      expires_at = excluded.expires_at
    WHERE kv.expires_at <= ?;
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  bind_blob(stmt.get(), 2, value);
  sqlite3_bind_int64(stmt.get(), 3, to_unix_ms(now + ttl));
  sqlite3_bind_int64(stmt.get(), 4, to_unix_ms(now));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("kv set_if_absent failed: {}", sqlite3_errmsg(db_.get()));
    return taskq::fail(Error::DatabaseError);
  }
  return changes() == 1;
}

auto SqliteStore::set(std::string_view key, const Bytes& value,
                      std::chrono::milliseconds ttl) -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO kv (key, value, expires_at) VALUES (?, ?, ?)
    ON CONFLICT(key) DO UPDATE SET
      value = excluded.value,
      expires_at = excluded.expires_at;
  )";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  bind_blob(stmt.get(), 2, value);
  sqlite3_bind_int64(stmt.get(), 3, to_unix_ms(Clock::now() + ttl));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return ok();
}

auto SqliteStore::get(std::string_view key) -> Result<std::optional<Bytes>> {
  std::lock_guard lock(mu_);
  auto result =
      prepare("SELECT value FROM kv WHERE key = ? AND expires_at > ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  sqlite3_bind_int64(stmt.get(), 2, to_unix_ms(Clock::now()));
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::optional<Bytes>{};
  }
  if (rc != SQLITE_ROW) {
    return taskq::fail(Error::DatabaseError);
  }
  return std::optional<Bytes>{col_blob(stmt.get(), 0)};
}

auto SqliteStore::erase(std::string_view key) -> Result<void> {
  std::lock_guard lock(mu_);
  auto result = prepare("DELETE FROM kv WHERE key = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return ok();
}

auto SqliteStore::erase_if(std::string_view key, const Bytes& expected)
    -> Result<bool> {
  std::lock_guard lock(mu_);
  auto result = prepare(
      "DELETE FROM kv WHERE key = ? AND value = ? AND expires_at > ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, key);
  bind_blob(stmt.get(), 2, expected);
  sqlite3_bind_int64(stmt.get(), 3, to_unix_ms(Clock::now()));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return changes() == 1;
}

auto SqliteStore::purge_expired() -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto result = prepare("DELETE FROM kv WHERE expires_at <= ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_int64(stmt.get(), 1, to_unix_ms(Clock::now()));
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return taskq::fail(Error::DatabaseError);
  }
  return static_cast<std::size_t>(changes());
}

}  // namespace taskq
