//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include "kernel.hpp"

namespace kcore {
namespace detail {
namespace kernel {

// runs before any member which logs is constructed
inline kcore::kernel::settings& prepare(kcore::kernel::settings& s) {
    kcore::config::logging::initialize();
    kcore::logger::thread_log_level(s.log_level);
    return s;
}

inline std::uint8_t* arena_start(kcore::kernel::settings& s,
                                 std::unique_ptr<std::uint8_t[]>& owned) {
    if(!s.heap_start) {
        owned.reset(new std::uint8_t[s.heap_size]);
        s.heap_start = owned.get();
    }

    return static_cast<std::uint8_t*>(s.heap_start);
}

}
}
}

kcore::kernel::settings::settings() :
    heap_start(nullptr),
    heap_size(config::kernel::heap_size()),
    default_capacity(config::channel::default_capacity()),
    max_services(config::registry::max_services()),
    log_level(config::logging::default_log_level())
{ }

kcore::kernel::kernel(settings s) :
    settings_(detail::kernel::prepare(s)),
    heap_(detail::kernel::arena_start(settings_, arena_), settings_.heap_size),
    services_(settings_.max_services)
{
    KCORE_HIGH_CONSTRUCTOR(settings_.heap_start, settings_.heap_size, settings_.default_capacity, settings_.max_services);
}

kcore::kernel::~kernel() {
    KCORE_HIGH_DESTRUCTOR();
}

std::string kcore::kernel::content() const {
    std::stringstream ss;
    ss << heap_ << ", " << exec_ << ", " << services_;
    return ss.str();
}

std::size_t kcore::kernel::tick() {
    heap_.poll();
    return exec_.tick();
}

std::size_t kcore::kernel::run_until_idle() {
    std::size_t polled = 0;

    do {
        polled += tick();
    } while(exec_.queued_count());

    return polled;
}

void kcore::kernel::run() {
    KCORE_HIGH_METHOD_ENTER("run");

    do {
        tick();
    } while(exec_.wait_for_work());
}

void kcore::kernel::stop() {
    exec_.stop();
}

kcore::registry::result kcore::kernel::checked_(const kcore::service_id& id,
                                                registry::result r) {
    if(r == registry::already_registered) [[unlikely]] {
        KCORE_ERROR_METHOD_BODY("checked_", "service ", id, " registered twice");
        throw kcore::service_already_registered(id);
    }

    KCORE_WARNING_GUARD(r == registry::full,
        KCORE_WARNING_METHOD_BODY("checked_", "registry is full, ", id, " was not registered"));

    return r;
}
