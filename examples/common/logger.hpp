#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace vigil::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level lvl = Level::Info;
        if (!parse_level(log_level, lvl)) {
            lvl = Level::Info;
        }
        Logger::instance().set_level(lvl);
    }

} // namespace vigil::examples
