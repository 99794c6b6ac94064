#pragma once

// ============================================================
// sender_app.hpp -- treepipe-send: dial the receiver and stream
//   the operand trees (or stdin lines) through the layers
// ============================================================

#include "../common/platform.hpp"
#include "../common/layers.hpp"
#include "../common/stream.hpp"
#include <iostream>
#include <string>
#include <vector>

struct SendConfig {
    std::string              dest_addr;      // host:port of a listening receiver
    std::vector<std::string> operands;       // empty = "."
    layers::LayerOptions     layers;
    bool                     lines_mode{false};
};

class SenderApp {
public:
    explicit SenderApp(SendConfig cfg, std::istream& lines_in = std::cin);

    // Connect, send, close. Returns 0; failures throw.
    int run();

    // Serialize every operand followed by the END record
    void send_tree(ByteWriter& out);

    // Forward lines until EOF, one flush per line
    void send_lines(ByteWriter& out);

    u64 entries() const { return entries_; }
    u64 bytes() const { return bytes_; }

private:
    SendConfig    cfg_;
    std::istream& lines_in_;
    u64           entries_{0};
    u64           bytes_{0};
};
