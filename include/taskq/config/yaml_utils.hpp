#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace taskq {

// Read-side view of one mapping node. Absent or null keys yield the fallback;
// a present key of the wrong type throws YAML::BadConversion, which the loader
// reports as a parse error.
class YamlFields {
public:
  explicit YamlFields(const YAML::Node& node) : node_(node) {}

  template <typename T>
  [[nodiscard]] auto get(std::string_view key, T fallback) const -> T {
    YAML::Node value = node_[std::string(key)];
    if (!value || value.IsNull()) {
      return fallback;
    }
    return value.as<T>();
  }

  [[nodiscard]] auto text(std::string_view key, std::string_view fallback) const
      -> std::string {
    return get<std::string>(key, std::string(fallback));
  }

  // Durations are plain integers under a key ending in "_ms".
  [[nodiscard]] auto millis(std::string_view key,
                            std::chrono::milliseconds fallback) const
      -> std::chrono::milliseconds {
    return std::chrono::milliseconds{get<std::int64_t>(key, fallback.count())};
  }

private:
  const YAML::Node& node_;
};

// Write-side counterpart, one mapping per scope.
class YamlMap {
public:
  explicit YamlMap(YAML::Emitter& out, bool flow = false) : out_(out) {
    if (flow) {
      out_ << YAML::Flow;
    }
    out_ << YAML::BeginMap;
  }
  ~YamlMap() { out_ << YAML::EndMap; }

  YamlMap(const YamlMap&) = delete;
  auto operator=(const YamlMap&) -> YamlMap& = delete;

  template <typename T>
  auto put(std::string_view key, const T& value) -> YamlMap& {
    out_ << YAML::Key << std::string(key) << YAML::Value << value;
    return *this;
  }

  auto put(std::string_view key, std::chrono::milliseconds value) -> YamlMap& {
    return put(key, static_cast<std::int64_t>(value.count()));
  }

  auto put(std::string_view key, std::string_view value) -> YamlMap& {
    return put(key, std::string(value));
  }

  auto put_nonempty(std::string_view key, std::string_view value) -> YamlMap& {
    if (!value.empty()) {
      put(key, value);
    }
    return *this;
  }

  // Emits the key and leaves the value to the caller.
  auto key(std::string_view key) -> YAML::Emitter& {
    return out_ << YAML::Key << std::string(key) << YAML::Value;
  }

private:
  YAML::Emitter& out_;
};

}  // namespace taskq
