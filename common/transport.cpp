// ============================================================
// transport.cpp -- Single-shot TCP dial / listen-accept
// ============================================================

#include "transport.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "scoped_close.hpp"
#include "utils.hpp"

namespace transport {

Endpoint parse_endpoint(const std::string& address, bool listening) {
    Endpoint ep;
    if (!utils::split_host_port(address, ep.host, ep.port)) {
        throw TransportError("invalid address '" + address + "' (expected host:port)");
    }
    if (!listening) {
        if (ep.host.empty()) {
            throw TransportError("invalid address '" + address + "': missing host");
        }
        if (ep.port == 0) {
            throw TransportError("invalid address '" + address + "': port 0");
        }
    }
    return ep;
}

static void run_connection(TcpSocket& sock, const ConnectionFn& fn) {
    run_then_close([&] { fn(sock); },
                   [&] { sock.close(); });
}

void with_dial(const std::string& address, const ConnectionFn& fn) {
    Endpoint ep = parse_endpoint(address, false);

    TcpSocket sock;
    sock.connect(ep.host, ep.port);
    LOG_DEBUG("Connected: " + sock.peer_addr());

    run_connection(sock, fn);
}

void with_listen(const std::string& bind_address, const ConnectionFn& fn,
                 const std::function<void(u16)>& on_listening) {
    Endpoint ep = parse_endpoint(bind_address, true);

    TcpSocket conn;
    {
        TcpSocket listener;
        listener.bind_and_listen(ep.host, ep.port);
        u16 port = listener.local_port();
        LOG_DEBUG("Listening: " + bind_address + " (port " + std::to_string(port) + ")");
        if (on_listening) on_listening(port);

        conn = listener.accept();
        // Exactly one connection per run: stop listening right away
        listener.close();
    }
    LOG_DEBUG("Accepted connection: " + conn.peer_addr());

    run_connection(conn, fn);
}

} // namespace transport
