#include "common.hpp"

#include "taskq/config/config.hpp"
#include "taskq/util/log.hpp"

#include <print>

namespace taskq::cli {

auto open_application(const CommonOptions& opts)
    -> Result<std::unique_ptr<Application>> {
  SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load {}: {}", opts.config_file,
                   loaded.error().message());
      return std::unexpected(loaded.error());
    }
    config = std::move(*loaded);
  }
  if (!opts.db_file.empty()) {
    config.storage.backend = StorageBackend::Sqlite;
    config.storage.db_file = opts.db_file;
  }
  log::set_level(config.log.level);

  auto app = std::make_unique<Application>(std::move(config));
  if (auto r = app->init(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return std::unexpected(r.error());
  }
  return app;
}

}  // namespace taskq::cli
