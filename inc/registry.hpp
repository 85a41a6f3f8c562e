//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_REGISTRY
#define KCORE_REGISTRY

// c++
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <any>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <sstream>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

// local
#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "channel.hpp"
#include "oneshot.hpp"

namespace kcore {
namespace config {
namespace registry {

/// the maximum count of services a registry accepts by default
std::size_t max_services();

}
}

/// stable identifier of a registered service
typedef std::string service_id;

/**
 @brief binary adapter between a value and its serialized bytes

 The primary template handles trivially copyable types by copying their
 object representation. Specialize it to expose other request and response
 types across a serialization boundary.
 */
template <typename T>
struct codec {
    static_assert(std::is_trivially_copyable_v<T>,
                  "kcore::codec<T> must be specialized for non trivially copyable T");

    static inline std::vector<std::uint8_t> encode(const T& t) {
        std::vector<std::uint8_t> out(sizeof(T));
        std::memcpy(out.data(), &t, sizeof(T));
        return out;
    }

    /// return false if `in` is not exactly one serialized T
    static inline bool decode(const std::vector<std::uint8_t>& in, T& t) {
        if(in.size() != sizeof(T)) { return false; }
        std::memcpy(&t, in.data(), sizeof(T));
        return true;
    }
};

/// length prefixed (32 bit little endian) characters
template <>
struct codec<std::string> {
    static std::vector<std::uint8_t> encode(const std::string& t);
    static bool decode(const std::vector<std::uint8_t>& in, std::string& t);
};

/// length prefixed (32 bit little endian) bytes
template <>
struct codec<std::vector<std::uint8_t>> {
    static std::vector<std::uint8_t> encode(const std::vector<std::uint8_t>& t);
    static bool decode(const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& t);
};

/// a serialized request arriving from outside the kernel
struct user_request {
    kcore::service_id id;
    std::uint64_t nonce = 0;
    std::vector<std::uint8_t> bytes;
};

/// the serialized reply to a `user_request` with the same nonce
struct user_response {
    kcore::service_id id;
    std::uint64_t nonce = 0;
    std::vector<std::uint8_t> bytes;
    bool ok = false; /// false when the request was dropped without a reply
};

/// destination of serialized replies
struct byte_sink {
    virtual ~byte_sink() { }
    virtual channel::result push(user_response&& r) = 0;
};

/// a byte_sink forwarding replies onto a channel
struct channel_sink : public byte_sink, public printable {
    channel_sink(kcore::producer<user_response> p) : p_(std::move(p)) { }
    virtual ~channel_sink() { }

    static inline std::string info_name() { return "kcore::channel_sink"; }
    inline std::string name() const { return channel_sink::info_name(); }

    inline channel::result push(user_response&& r) { return p_.try_send(std::move(r)); }

private:
    kcore::producer<user_response> p_;
};

/**
 @brief the route a response takes back to its requester

 Holds one of:
 - nothing, replies report `closed`
 - a channel producer
 - a oneshot sender
 - a userspace route: the request's nonce, the sink its serialized reply goes
   to and the encoder of the response type

 Replying consumes the route. A userspace route destroyed without a reply
 pushes a response with `ok == false`, so the external requester always
 hears back.
 */
template <typename R>
struct reply_to : public printable {
    struct userspace_route {
        typedef std::vector<std::uint8_t> (*encoder)(const R&);

        std::uint64_t nonce = 0;
        kcore::byte_sink* sink = nullptr;
        kcore::service_id id;
        encoder encode = nullptr;
    };

    reply_to() { }
    reply_to(kcore::producer<R> p) : route_(std::move(p)) { }
    reply_to(kcore::oneshot_sender<R>&& s) : route_(std::move(s)) { }
    reply_to(userspace_route u) : route_(std::move(u)) { }

    reply_to(const reply_to<R>&) = delete;
    reply_to(reply_to<R>&& rhs) : route_(std::move(rhs.route_)) { rhs.forget(); }

    virtual ~reply_to() { fail_(); }

    reply_to<R>& operator=(const reply_to<R>&) = delete;

    inline reply_to<R>& operator=(reply_to<R>&& rhs) {
        if(this != &rhs) {
            fail_();
            route_ = std::move(rhs.route_);
            rhs.forget();
        }

        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<R>("kcore::reply_to");
    }

    inline std::string name() const { return reply_to<R>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "route:" << route_.index();
        return ss.str();
    }

    /// return true if a reply can be attempted
    inline explicit operator bool() const { return route_.index() != 0; }

    /// return true if this is a userspace route
    inline bool userspace() const { return route_.index() == 3; }

    /**
     @brief deliver a response along the route

     @return success, or the failure reported by the route (closed when there is no route)
     */
    inline channel::result reply(R r) {
        KCORE_LOW_METHOD_ENTER("reply");
        channel::result res = channel::closed;

        switch(route_.index()) {
            case 1:
                res = std::get<1>(route_).try_send(std::move(r));
                break;
            case 2:
                res = std::get<2>(route_).send(std::move(r)) == oneshot_result::success
                    ? channel::success
                    : channel::closed;
                break;
            case 3: {
                userspace_route& u = std::get<3>(route_);
                res = u.sink->push(
                    user_response{ u.id, u.nonce, u.encode(r), true });
                break;
            }
            default:
                break;
        }

        forget();
        return res;
    }

    /// drop the route without notifying anyone
    inline void forget() { route_.template emplace<0>(); }

private:
    inline void fail_() {
        if(route_.index() == 3) {
            userspace_route& u = std::get<3>(route_);
            KCORE_LOW_METHOD_BODY("fail_", "unanswered userspace request ", u.nonce);
            channel::result r = u.sink->push(user_response{ u.id, u.nonce, {}, false });

            KCORE_WARNING_GUARD(r != channel::success,
                KCORE_WARNING_METHOD_BODY("fail_", "failure response for ", u.nonce, " was ", channel::result_name(r)));
        }
    }

    std::variant<std::monostate,
                 kcore::producer<R>,
                 kcore::oneshot_sender<R>,
                 userspace_route> route_;
};

/**
 @brief a request plus its reply route

 Services are described by a traits type:
 ```
 struct echo {
     typedef std::string request_type;
     typedef std::string response_type;
     static kcore::service_id id() { return "echo"; }
 };
 ```
 and receive `kcore::message<echo>` on their channel.
 */
template <typename REQUEST, typename RESPONSE>
struct envelope {
    typedef REQUEST request_type;
    typedef RESPONSE response_type;

    request_type request;
    kcore::reply_to<response_type> reply;
};

template <typename S>
using message = envelope<typename S::request_type, typename S::response_type>;

/**
 @brief service discovery table

 Binds service ids to the producer handles of the channels the services
 receive on. Registration happens during initialization, lookups copy the
 stored producer.

 Services registered with `set()` can also be reached from outside the
 kernel through a `userspace_handle`, which decodes serialized requests with
 `kcore::codec` and forwards them with a userspace reply route.
 */
struct registry : public printable {
    enum result {
        success,
        already_registered,
        full
    };

    static inline const char* result_name(result r) {
        switch(r) {
            case success: return "success";
            case already_registered: return "already_registered";
            case full: return "full";
            default: return "unknown";
        }
    }

    /// type erased deserialize and forward adapter for one service
    struct userspace_handle : public printable {
        enum result {
            success,
            decode_error,
            full,
            closed
        };

        typedef std::function<result(user_request&&, byte_sink&)> operation;

        userspace_handle(kcore::service_id id, operation op) :
            id_(std::move(id)),
            op_(std::move(op))
        { }

        static inline std::string info_name() { return "kcore::registry::userspace_handle"; }
        inline std::string name() const { return userspace_handle::info_name(); }
        inline std::string content() const { return id_; }

        inline const kcore::service_id& id() const { return id_; }

        /**
         @brief decode a request and forward it to the service

         The service's reply is serialized and pushed onto `sink`, which must
         outlive the request.
         */
        result process(user_request req, byte_sink& sink);

    private:
        kcore::service_id id_;
        operation op_;
    };

    registry(std::size_t max_services = config::registry::max_services());
    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    virtual ~registry();

    static inline std::string info_name() { return "kcore::registry"; }
    inline std::string name() const { return registry::info_name(); }
    std::string content() const;

    /// register a service reachable only from inside the kernel
    template <typename S>
    result set_konly(kcore::producer<kcore::message<S>> p) {
        KCORE_MED_METHOD_ENTER("set_konly", S::id());
        return insert_(registry::make_entry_<S>(std::move(p), {}));
    }

    /// register a service reachable from inside and outside the kernel
    template <typename S>
    result set(kcore::producer<kcore::message<S>> p) {
        typedef typename S::request_type request_type;
        typedef typename S::response_type response_type;
        KCORE_MED_METHOD_ENTER("set", S::id());

        userspace_handle::operation op =
            [p](user_request&& req, byte_sink& sink) mutable -> userspace_handle::result {
                kcore::message<S> m;

                if(!kcore::codec<request_type>::decode(req.bytes, m.request)) {
                    KCORE_WARNING_FUNCTION_BODY("kcore::registry::userspace_handle", "cannot decode request for ", req.id);
                    return userspace_handle::decode_error;
                }

                m.reply = kcore::reply_to<response_type>(
                    typename kcore::reply_to<response_type>::userspace_route{
                        req.nonce, &sink, req.id, &kcore::codec<response_type>::encode });

                switch(p.try_send(std::move(m))) {
                    case channel::success:
                        return userspace_handle::success;
                    case channel::full:
                        m.reply.forget();
                        return userspace_handle::full;
                    default:
                        m.reply.forget();
                        return userspace_handle::closed;
                }
            };

        return insert_(registry::make_entry_<S>(std::move(p), std::move(op)));
    }

    /**
     @brief look up a service

     @return a copy of the service's producer, or nullopt if the id is unknown or was registered with different request or response types
     */
    template <typename S>
    std::optional<kcore::producer<kcore::message<S>>> get() const {
        typedef kcore::producer<kcore::message<S>> handle;
        std::lock_guard<kcore::spinlock> lk(lk_);
        const entry* e = find_(S::id());

        if(!e) {
            KCORE_LOW_METHOD_BODY("get", S::id(), " is not registered");
            return std::nullopt;
        }

        if(e->witness != std::type_index(typeid(kcore::message<S>))) {
            KCORE_WARNING_METHOD_BODY("get", S::id(), " is registered with different types");
            return std::nullopt;
        }

        return std::any_cast<handle>(e->endpoint);
    }

    /// look up the userspace adapter of a service registered with `set()`
    std::optional<userspace_handle> get_userspace(const kcore::service_id& id) const;

    /// return true if `id` is registered
    bool contains(const kcore::service_id& id) const;

    /// the count of registered services
    std::size_t size() const;

    /// the maximum count of registered services
    inline std::size_t max_services() const { return max_; }

private:
    struct entry {
        kcore::service_id id;
        std::type_index witness;
        std::any endpoint; // kcore::producer<kcore::message<S>>
        userspace_handle::operation userspace; // empty for kernel only services
    };

    template <typename S>
    static entry make_entry_(kcore::producer<kcore::message<S>> p,
                             userspace_handle::operation op) {
        return entry{ S::id(),
                      std::type_index(typeid(kcore::message<S>)),
                      std::any(std::move(p)),
                      std::move(op) };
    }

    result insert_(entry&& e);

    // lk_ must be held
    const entry* find_(const kcore::service_id& id) const;

    mutable kcore::spinlock lk_;
    const std::size_t max_;
    std::vector<entry> entries_;
};

}

#endif
