#include "fatal.hpp"
#include <cstdlib>

namespace notifctl {

fatal_handler exit_on_fatal(std::shared_ptr<spdlog::logger> log) {
    return [log = std::move(log)](const std::string& message) {
        log->critical("{}", message);
        log->flush();
        // Other threads keep running; skip static destructors
        std::_Exit(EXIT_FAILURE);
    };
}

} // namespace notifctl
