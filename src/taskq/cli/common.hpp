#pragma once

#include "taskq/app/application.hpp"
#include "taskq/cli/commands.hpp"
#include "taskq/core/error.hpp"

#include <memory>

namespace taskq::cli {

// Loads the config (or defaults), applies the db override and initializes an
// Application without starting workers.
[[nodiscard]] auto open_application(const CommonOptions& opts)
    -> Result<std::unique_ptr<Application>>;

}  // namespace taskq::cli
