#pragma once

#include <spdlog/spdlog.h>
#include <functional>
#include <memory>
#include <string>

namespace notifctl {

// Invoked for unrecoverable conditions. The production handler never returns.
using fatal_handler = std::function<void(const std::string& message)>;

// Logs the message at critical level, flushes, and exits with status 1.
fatal_handler exit_on_fatal(std::shared_ptr<spdlog::logger> log);

} // namespace notifctl
