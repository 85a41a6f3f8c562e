//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_KERNEL
#define KCORE_KERNEL

// c++
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <exception>
#include <string>
#include <sstream>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "coroutine.hpp"
#include "task.hpp"
#include "executor.hpp"
#include "allocator.hpp"
#include "channel.hpp"
#include "registry.hpp"

namespace kcore {
namespace config {
namespace kernel {

/// the size of the arena a kernel allocates when no arena is provided
std::size_t heap_size();

}
}

/// raised when a service id is registered twice on one kernel
struct service_already_registered : public std::exception {
    service_already_registered(const kcore::service_id& id) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "service " << id << " is already registered";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief the kernel context object

 Owns the allocator, the executor and the service registry of one kernel
 instance. Drivers are spawned as tasks, allocate through `heap()` and find
 each other through the registry.

 ```
 kcore::kernel k;
 auto [tx, rx] = k.make_channel<kcore::message<echo>>(1);
 k.register_service<echo>(tx);
 k.spawn(echo_driver(k, std::move(rx)));
 k.run_until_idle();
 ```

 Destruction order is the reverse of ownership: tasks are destroyed first,
 then the registry's channel handles, then the allocator and its arena.
 */
struct kernel : public printable {
    /// construction parameters, plain data
    struct settings {
        /// fills every field from the `kcore::config` defaults
        settings();

        /// arena start, nullptr makes the kernel allocate `heap_size` bytes itself
        void* heap_start;
        std::size_t heap_size;
        std::size_t default_capacity;
        std::size_t max_services;
        int log_level;
    };

    kernel(settings s = settings());
    kernel(const kernel&) = delete;
    kernel(kernel&&) = delete;
    virtual ~kernel();

    kernel& operator=(const kernel&) = delete;
    kernel& operator=(kernel&&) = delete;

    static inline std::string info_name() { return "kcore::kernel"; }
    inline std::string name() const { return kernel::info_name(); }
    std::string content() const;

    inline const settings& get_settings() const { return settings_; }

    /// the kernel's async allocator
    inline kcore::allocator& heap() { return heap_; }

    /// the kernel's executor
    inline kcore::executor& tasks() { return exec_; }

    /// the kernel's service registry
    inline kcore::registry& services() { return services_; }

    /// spawn a driver task
    template <typename T>
    inline join<T> spawn(co<T>&& c) { return exec_.spawn(std::move(c)); }

    /**
     @brief register a service reachable only from inside the kernel

     A duplicate id is a configuration error: it is logged and
     `kcore::service_already_registered` is raised.

     @return success, or full when the registry is at capacity
     */
    template <typename S>
    registry::result register_service(kcore::producer<kcore::message<S>> p) {
        KCORE_MED_METHOD_ENTER("register_service", S::id());
        return checked_(S::id(), services_.set_konly<S>(std::move(p)));
    }

    /// register a service reachable from inside and outside the kernel
    template <typename S>
    registry::result register_userspace_service(kcore::producer<kcore::message<S>> p) {
        KCORE_MED_METHOD_ENTER("register_userspace_service", S::id());
        return checked_(S::id(), services_.set<S>(std::move(p)));
    }

    /// look up a service's producer
    template <typename S>
    inline std::optional<kcore::producer<kcore::message<S>>> get_service() const {
        return services_.get<S>();
    }

    /// look up the userspace adapter of a service
    inline std::optional<registry::userspace_handle> get_userspace_service(const kcore::service_id& id) const {
        return services_.get_userspace(id);
    }

    /// construct a channel with the kernel's default capacity
    template <typename T>
    inline std::pair<kcore::producer<T>, kcore::consumer<T>>
    make_channel(channel::shape s = channel::shape::spsc) {
        return channel::make<T>(settings_.default_capacity, s);
    }

    template <typename T>
    inline std::pair<kcore::producer<T>, kcore::consumer<T>>
    make_channel(std::size_t capacity, channel::shape s = channel::shape::spsc) {
        return channel::make<T>(capacity, s);
    }

    /**
     @brief drain deferred frees, then tick the executor once

     @return the count of tasks polled
     */
    std::size_t tick();

    /// tick until no task is runnable, returning the count of polls
    std::size_t run_until_idle();

    /// tick until `stop()` is called, idling while no task is runnable
    void run();

    /// request `run()` to return
    void stop();

private:
    // throw on a duplicate registration
    registry::result checked_(const kcore::service_id& id, registry::result r);

    // member order is construction order
    settings settings_;
    std::unique_ptr<std::uint8_t[]> arena_;
    kcore::allocator heap_;
    kcore::registry services_;
    kcore::executor exec_;
};

}

#endif
