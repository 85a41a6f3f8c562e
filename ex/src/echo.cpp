#include <iostream>
#include <string>
#include <kcore.hpp>

struct echo {
    typedef std::string request_type;
    typedef std::string response_type;
    static kcore::service_id id() { return "echo"; }
};

// answers every request with its reversal until the channel closes
kcore::co<void> echo_driver(kcore::consumer<kcore::message<echo>> rx) {
    kcore::message<echo> m;

    while(co_await rx.recv(m) == kcore::channel::success) {
        std::string reply(m.request.rbegin(), m.request.rend());

        if(m.reply.reply(std::move(reply)) != kcore::channel::success) {
            std::cout << "echo could not answer " << m.request << std::endl;
        }
    }

    co_return;
}

kcore::co<void> client(kcore::kernel& k, std::string text) {
    auto service = k.get_service<echo>();

    if(!service) {
        std::cout << "echo is not available" << std::endl;
        co_return;
    }

    kcore::oneshot<std::string> reply;
    kcore::oneshot_sender<std::string> tx;

    if(reply.sender(tx) != kcore::oneshot_result::success) { co_return; }

    kcore::message<echo> m{ text, kcore::reply_to<std::string>(std::move(tx)) };

    if(co_await service->send(std::move(m)) != kcore::channel::success) {
        std::cout << "echo closed" << std::endl;
        co_return;
    }

    std::string response;

    if(co_await reply.receive(response) == kcore::oneshot_result::success) {
        std::cout << text << " -> " << response << std::endl;
    }

    co_return;
}

int main() {
    // replies routed through the sink must never outlive it
    auto [utx, urx] = kcore::channel::make<kcore::user_response>(4);
    kcore::channel_sink sink(std::move(utx));
    kcore::kernel k;

    {
        auto [tx, rx] = k.make_channel<kcore::message<echo>>(1);
        if(k.register_userspace_service<echo>(std::move(tx)) != kcore::registry::success) {
            return 1;
        }

        k.spawn(echo_driver(std::move(rx)));
    }

    k.spawn(client(k, "ping"));
    k.spawn(client(k, "hello"));
    k.run_until_idle();

    // the same service reached through its serialized adapter
    auto handle = k.get_userspace_service("echo");

    if(handle && handle->process(
            kcore::user_request{ "echo", 1, kcore::codec<std::string>::encode("userspace") },
            sink) == kcore::registry::userspace_handle::success) {
        k.run_until_idle();

        kcore::user_response r;
        std::string decoded;

        if(urx.try_recv(r) == kcore::channel::success &&
           kcore::codec<std::string>::decode(r.bytes, decoded)) {
            std::cout << "userspace -> " << decoded << std::endl;
        }
    }

    return 0;
}
