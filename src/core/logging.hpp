#pragma once

#include <string>

namespace sentindex {

/// Install the async "sentindex" logger as spdlog's default
/// @param level spdlog level name (trace, debug, info, warn, error, critical, off)
void init_logging(const std::string& level);

}  // namespace sentindex
