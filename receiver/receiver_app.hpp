#pragma once

// ============================================================
// receiver_app.hpp -- treepipe-recv: accept one sender and
//   extract its archive (or print its lines)
// ============================================================

#include "../common/platform.hpp"
#include "../common/layers.hpp"
#include "../common/stream.hpp"
#include <functional>
#include <iostream>
#include <string>

struct ReceiveConfig {
    std::string          bind_addr;          // host:port or :port
    std::string          dest_dir{"."};
    layers::LayerOptions layers;
    bool                 lines_mode{false};
};

class ReceiverApp {
public:
    explicit ReceiverApp(ReceiveConfig cfg, std::ostream& lines_out = std::cout);

    // Listen, accept one connection, receive, close. Returns 0; failures throw.
    // on_listening receives the bound port before accept blocks.
    int run(const std::function<void(u16)>& on_listening = nullptr);

    // Extract records until END, then drain what is left of the stream
    void receive_tree(ByteReader& in);

    // Print "RECEIVED: <line>" for every line until EOF
    void receive_lines(ByteReader& in);

    u64 entries() const { return entries_; }
    u64 bytes() const { return bytes_; }

private:
    ReceiveConfig cfg_;
    std::ostream& lines_out_;
    u64           entries_{0};
    u64           bytes_{0};
};
