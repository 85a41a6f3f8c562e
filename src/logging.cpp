//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "logging.hpp"

int& kcore::logger::tl_loglevel() {
    thread_local int level = kcore::config::logging::default_log_level();
    return level;
}

int kcore::logger::thread_log_level() { return kcore::logger::tl_loglevel(); }

void kcore::logger::thread_log_level(int level) {
    if(level > 9) { level = 9; }
    else if(level < -9) { level = -9; }
    kcore::logger::tl_loglevel() = level;
}
