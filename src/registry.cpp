//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <algorithm>

#include "registry.hpp"

namespace kcore {
namespace detail {
namespace registry {

inline void put_length(std::vector<std::uint8_t>& out, std::size_t len) {
    std::uint32_t l = static_cast<std::uint32_t>(len);

    for(std::size_t i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((l >> (8 * i)) & 0xFF));
    }
}

// return false if `in` is not a length prefix followed by exactly that many bytes
inline bool get_length(const std::vector<std::uint8_t>& in, std::size_t& len) {
    if(in.size() < 4) { return false; }
    std::uint32_t l = 0;

    for(std::size_t i = 0; i < 4; ++i) {
        l |= static_cast<std::uint32_t>(in[i]) << (8 * i);
    }

    len = l;
    return in.size() - 4 == len;
}

}
}
}

std::vector<std::uint8_t> kcore::codec<std::string>::encode(const std::string& t) {
    std::vector<std::uint8_t> out;
    out.reserve(4 + t.size());
    detail::registry::put_length(out, t.size());
    out.insert(out.end(), t.begin(), t.end());
    return out;
}

bool kcore::codec<std::string>::decode(const std::vector<std::uint8_t>& in, std::string& t) {
    std::size_t len;
    if(!detail::registry::get_length(in, len)) { return false; }
    t.assign(in.begin() + 4, in.end());
    return true;
}

std::vector<std::uint8_t> kcore::codec<std::vector<std::uint8_t>>::encode(
        const std::vector<std::uint8_t>& t)
{
    std::vector<std::uint8_t> out;
    out.reserve(4 + t.size());
    detail::registry::put_length(out, t.size());
    out.insert(out.end(), t.begin(), t.end());
    return out;
}

bool kcore::codec<std::vector<std::uint8_t>>::decode(
        const std::vector<std::uint8_t>& in,
        std::vector<std::uint8_t>& t)
{
    std::size_t len;
    if(!detail::registry::get_length(in, len)) { return false; }
    t.assign(in.begin() + 4, in.end());
    return true;
}

kcore::registry::userspace_handle::result
kcore::registry::userspace_handle::process(user_request req, byte_sink& sink) {
    KCORE_LOW_METHOD_ENTER("process", req.id, req.nonce, req.bytes.size());
    result r = op_(std::move(req), sink);

    KCORE_LOW_GUARD(r != success,
        KCORE_LOW_METHOD_BODY("process", "failed with ", (int)r));

    return r;
}

kcore::registry::registry(std::size_t max_services) : max_(max_services) {
    KCORE_HIGH_CONSTRUCTOR(max_services);
    entries_.reserve(max_);
}

kcore::registry::~registry() {
    KCORE_HIGH_DESTRUCTOR();
}

std::string kcore::registry::content() const {
    std::stringstream ss;
    std::lock_guard<kcore::spinlock> lk(lk_);
    ss << "services:[";

    for(auto it = entries_.begin(); it != entries_.end(); ++it) {
        if(it != entries_.begin()) { ss << ", "; }
        ss << it->id;
    }

    ss << "]";
    return ss.str();
}

std::optional<kcore::registry::userspace_handle>
kcore::registry::get_userspace(const kcore::service_id& id) const {
    KCORE_LOW_METHOD_ENTER("get_userspace", id);
    std::lock_guard<kcore::spinlock> lk(lk_);
    const entry* e = find_(id);

    if(e && e->userspace) {
        return userspace_handle(e->id, e->userspace);
    } else {
        KCORE_LOW_METHOD_BODY("get_userspace", id, " has no userspace adapter");
        return std::nullopt;
    }
}

bool kcore::registry::contains(const kcore::service_id& id) const {
    std::lock_guard<kcore::spinlock> lk(lk_);
    return find_(id) != nullptr;
}

std::size_t kcore::registry::size() const {
    std::lock_guard<kcore::spinlock> lk(lk_);
    return entries_.size();
}

kcore::registry::result kcore::registry::insert_(entry&& e) {
    std::lock_guard<kcore::spinlock> lk(lk_);

    if(find_(e.id)) {
        KCORE_WARNING_METHOD_BODY("insert_", e.id, " is already registered");
        return already_registered;
    }

    if(entries_.size() >= max_) {
        KCORE_WARNING_METHOD_BODY("insert_", "cannot register ", e.id, ", ", max_, " services registered");
        return full;
    }

    KCORE_MED_METHOD_BODY("insert_", "registered ", e.id);
    entries_.push_back(std::move(e));
    return success;
}

const kcore::registry::entry* kcore::registry::find_(const kcore::service_id& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const entry& e) {
        return e.id == id;
    });

    return it == entries_.end() ? nullptr : &(*it);
}
