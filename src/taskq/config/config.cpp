#include "taskq/config/config.hpp"

#include "taskq/config/yaml_utils.hpp"
#include "taskq/schedule/cron.hpp"
#include "taskq/util/log.hpp"

#include <nlohmann/json.hpp>

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <unordered_set>

namespace YAML {

template <>
struct convert<taskq::StorageConfig> {
  static bool decode(const Node& node, taskq::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    auto backend = f.text("backend", "sqlite");
    auto parsed = taskq::parse_storage_backend(backend);
    if (!parsed) {
      taskq::log::error("Unknown storage backend '{}'", backend);
      return false;
    }
    s.backend = *parsed;
    s.db_file = f.text("db_file", s.db_file);
    return true;
  }
};

template <>
struct convert<taskq::WorkerConfig> {
  static bool decode(const Node& node, taskq::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    w.concurrency = f.get("concurrency", w.concurrency);
    w.shutdown_timeout = f.millis("shutdown_timeout_ms", w.shutdown_timeout);
    w.processing_timeout =
        f.millis("processing_timeout_ms", w.processing_timeout);
    w.poll_interval = f.millis("poll_interval_ms", w.poll_interval);
    w.lease = f.millis("lease_ms", w.lease);
    w.janitor_interval = f.millis("janitor_interval_ms", w.janitor_interval);
    w.completed_retention =
        f.millis("completed_retention_ms", w.completed_retention);
    w.panic_is_terminal = f.get("panic_is_terminal", w.panic_is_terminal);
    return true;
  }
};

template <>
struct convert<taskq::QueueConfig> {
  static bool decode(const Node& node, taskq::QueueConfig& q) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    q.name = f.text("name", "");
    q.weight = f.get("weight", 1);
    return true;
  }
};

template <>
struct convert<taskq::RetryConfig> {
  static bool decode(const Node& node, taskq::RetryConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    r.base_delay = f.millis("base_delay_ms", r.base_delay);
    r.max_delay = f.millis("max_delay_ms", r.max_delay);
    r.jitter = f.get("jitter", r.jitter);
    r.default_max_retry = f.get("default_max_retry", r.default_max_retry);
    return true;
  }
};

template <>
struct convert<taskq::IdempotencyConfig> {
  static bool decode(const Node& node, taskq::IdempotencyConfig& i) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    i.ttl = f.millis("ttl_ms", i.ttl);
    i.key_prefix = f.text("key_prefix", i.key_prefix);
    auto mode = f.text("fail_mode", "open");
    auto parsed = taskq::parse_fail_mode(mode);
    if (!parsed) {
      taskq::log::error("Unknown idempotency fail_mode '{}'", mode);
      return false;
    }
    i.fail_mode = *parsed;
    return true;
  }
};

template <>
struct convert<taskq::ScheduleConfig> {
  static bool decode(const Node& node, taskq::ScheduleConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    s.cron = f.text("cron", "");
    s.type = f.text("type", "");
    s.payload = f.text("payload", s.payload);
    s.queue = f.text("queue", s.queue);
    if (node["max_retry"]) {
      s.max_retry = f.get("max_retry", 0);
    }
    s.description = f.text("description", "");
    return true;
  }
};

template <>
struct convert<taskq::LogConfig> {
  static bool decode(const Node& node, taskq::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    taskq::YamlFields f{node};
    l.level = f.text("level", "info");
    l.file = f.text("file", "");
    return true;
  }
};

template <>
struct convert<taskq::SystemConfig> {
  static bool decode(const Node& node, taskq::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskq::StorageConfig>();
    }
    if (auto worker = node["worker"]) {
      c.worker = worker.as<taskq::WorkerConfig>();
    }
    if (auto queues = node["queues"]) {
      if (!queues.IsSequence()) {
        return false;
      }
      c.queues = queues.as<std::vector<taskq::QueueConfig>>();
    }
    if (auto retry = node["retry"]) {
      c.retry = retry.as<taskq::RetryConfig>();
    }
    if (auto idem = node["idempotency"]) {
      c.idempotency = idem.as<taskq::IdempotencyConfig>();
    }
    if (auto schedules = node["schedules"]) {
      if (!schedules.IsSequence()) {
        return false;
      }
      c.schedules = schedules.as<std::vector<taskq::ScheduleConfig>>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<taskq::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskq {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  {
    YamlMap root{out};
    {
      YamlMap storage{root.key("storage")};
      storage.put("backend", storage_backend_name(config.storage.backend))
          .put("db_file", config.storage.db_file);
    }
    {
      const auto& w = config.worker;
      YamlMap worker{root.key("worker")};
      worker.put("concurrency", w.concurrency)
          .put("shutdown_timeout_ms", w.shutdown_timeout)
          .put("processing_timeout_ms", w.processing_timeout)
          .put("poll_interval_ms", w.poll_interval)
          .put("lease_ms", w.lease)
          .put("janitor_interval_ms", w.janitor_interval);
      if (w.completed_retention.count() != 0) {
        worker.put("completed_retention_ms", w.completed_retention);
      }
      if (w.panic_is_terminal) {
        worker.put("panic_is_terminal", true);
      }
    }
    root.key("queues") << YAML::BeginSeq;
    for (const auto& q : config.queues) {
      YamlMap(out, true).put("name", q.name).put("weight", q.weight);
    }
    out << YAML::EndSeq;
    {
      const auto& r = config.retry;
      YamlMap retry{root.key("retry")};
      retry.put("base_delay_ms", r.base_delay)
          .put("max_delay_ms", r.max_delay)
          .put("jitter", r.jitter)
          .put("default_max_retry", r.default_max_retry);
    }
    {
      const auto& i = config.idempotency;
      YamlMap idem{root.key("idempotency")};
      idem.put("ttl_ms", i.ttl)
          .put("key_prefix", i.key_prefix)
          .put("fail_mode", fail_mode_name(i.fail_mode));
    }
    if (!config.schedules.empty()) {
      root.key("schedules") << YAML::BeginSeq;
      for (const auto& sc : config.schedules) {
        YamlMap entry{out};
        entry.put("cron", sc.cron)
            .put("type", sc.type)
            .put("payload", sc.payload)
            .put("queue", sc.queue);
        if (sc.max_retry) {
          entry.put("max_retry", *sc.max_retry);
        }
        entry.put_nonempty("description", sc.description);
      }
      out << YAML::EndSeq;
    }
    {
      YamlMap log{root.key("log")};
      log.put("level", config.log.level).put_nonempty("file", config.log.file);
    }
  }
  return out.c_str();
}

auto validate(const SystemConfig& config) -> Result<void> {
  if (config.queues.empty()) {
    log::error("Config: at least one queue is required");
    return fail(Error::InvalidArgument);
  }
  std::unordered_set<std::string_view> seen;
  for (const auto& q : config.queues) {
    if (q.name.empty()) {
      log::error("Config: queue name must not be empty");
      return fail(Error::InvalidArgument);
    }
    if (!seen.insert(q.name).second) {
      log::error("Config: duplicate queue '{}'", q.name);
      return fail(Error::InvalidArgument);
    }
    if (q.weight < 1) {
      log::error("Config: queue '{}' has weight {}, must be >= 1", q.name,
                 q.weight);
      return fail(Error::InvalidArgument);
    }
  }

  const auto& w = config.worker;
  if (w.concurrency < 1) {
    log::error("Config: worker.concurrency must be >= 1");
    return fail(Error::InvalidArgument);
  }
  if (w.shutdown_timeout.count() <= 0 || w.processing_timeout.count() <= 0 ||
      w.poll_interval.count() <= 0 || w.lease.count() <= 0 ||
      w.janitor_interval.count() <= 0) {
    log::error("Config: worker timeouts and intervals must be positive");
    return fail(Error::InvalidArgument);
  }

  const auto& r = config.retry;
  if (r.base_delay.count() <= 0 || r.max_delay < r.base_delay ||
      r.jitter < 0.0 || r.default_max_retry < 0) {
    log::error("Config: invalid retry settings");
    return fail(Error::InvalidArgument);
  }

  if (config.idempotency.ttl.count() <= 0) {
    log::error("Config: idempotency.ttl_ms must be positive");
    return fail(Error::InvalidArgument);
  }

  for (const auto& sc : config.schedules) {
    if (sc.type.empty()) {
      log::error("Config: schedule '{}' has no task type", sc.cron);
      return fail(Error::InvalidArgument);
    }
    if (!seen.contains(sc.queue)) {
      log::error("Config: schedule {} targets unknown queue '{}'", sc.type,
                 sc.queue);
      return fail(Error::InvalidArgument);
    }
    if (!validate_cronspec(sc.cron)) {
      return fail(Error::InvalidArgument);
    }
    if (!nlohmann::json::accept(sc.payload)) {
      log::error("Config: schedule {} payload is not valid JSON", sc.type);
      return fail(Error::InvalidArgument);
    }
    if (sc.max_retry && *sc.max_retry < 0) {
      log::error("Config: schedule {} has negative max_retry", sc.type);
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

}  // namespace taskq
