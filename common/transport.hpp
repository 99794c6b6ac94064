#pragma once

// ============================================================
// transport.hpp -- Single-shot TCP dial / listen-accept
//
// One connection per run. The socket is handed to the callback
// and closed exactly once afterwards; a close failure is only
// reported when the callback itself succeeded.
// ============================================================

#include "platform.hpp"
#include "socket.hpp"
#include <functional>
#include <string>

namespace transport {

struct Endpoint {
    std::string host;   // empty = all interfaces (listen only)
    u16         port{0};
};

// Parse "host:port" / ":port". Port 0 is only valid when listening.
// Throws TransportError on malformed input.
Endpoint parse_endpoint(const std::string& address, bool listening);

using ConnectionFn = std::function<void(TcpSocket&)>;

// Connect to address, run fn, close.
void with_dial(const std::string& address, const ConnectionFn& fn);

// Bind, accept exactly one connection, stop listening, run fn, close.
// on_listening (optional) receives the bound port before accept blocks.
void with_listen(const std::string& bind_address, const ConnectionFn& fn,
                 const std::function<void(u16)>& on_listening = nullptr);

} // namespace transport
