//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
/*
 This file contains the various `kcore::config::` implementations necessary
 for setting framework values.

 Each accessor is declared in the header of the feature it configures so that
 features can configure themselves without depending on each other. The
 values come from compiler defines, runtime configuration is passed as plain
 data through `kcore::kernel::settings`.
 */
#include <sstream>
#include <string>

#include "loguru.hpp"
#include "utility.hpp"
#include "logging.hpp"
#include "heap.hpp"
#include "channel.hpp"
#include "registry.hpp"
#include "kernel.hpp"

#ifndef KCORELOGLEVEL
#define KCORELOGLEVEL -1
#endif

#ifndef KCOREDEFAULTCHANNELCAPACITY
#define KCOREDEFAULTCHANNELCAPACITY 16
#endif

#ifndef KCOREMAXSERVICES
#define KCOREMAXSERVICES 32
#endif

#ifndef KCOREHEAPSIZE
#define KCOREHEAPSIZE 65536
#endif

int kcore::config::logging::default_log_level() {
    int level = KCORELOGLEVEL;
    if(level > 9) { level = 9; }
    else if(level < -9) { level = -9; }
    return level;
}

void kcore::config::logging::initialize() {
    struct do_once {
        do_once() {
            std::stringstream ss;
            ss << "-v" << kcore::config::logging::default_log_level();
            std::string process("kcore");
            std::string verbosity = ss.str();

            const char* argv[] = {process.c_str(), verbosity.c_str(), nullptr};
            int argc = 2;

            loguru::Options opt;
            opt.main_thread_name = nullptr;
            opt.signal_options = loguru::SignalOptions::none();
            loguru::init(argc, const_cast<char**>(argv), opt);
        }
    };

    static do_once d; // static so init only happens once
}

std::size_t kcore::config::heap::block_size() {
    return 2 * sizeof(void*);
}

std::size_t kcore::config::channel::default_capacity() {
    return KCOREDEFAULTCHANNELCAPACITY > 0 ? KCOREDEFAULTCHANNELCAPACITY : 1;
}

std::size_t kcore::config::registry::max_services() {
    return KCOREMAXSERVICES;
}

std::size_t kcore::config::kernel::heap_size() {
    return KCOREHEAPSIZE;
}
