#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace stagecraft {

/// The "stagecraft" logger. Created on first use with a colored stdout sink;
/// if a logger of that name was already registered by the application, that
/// one is used instead.
std::shared_ptr<spdlog::logger> const& logger();

void set_log_level(spdlog::level::level_enum Level);

} // namespace stagecraft
