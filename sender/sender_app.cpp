// ============================================================
// sender_app.cpp -- treepipe-send: dial the receiver and stream
//   the operand trees (or stdin lines) through the layers
// ============================================================

#include "sender_app.hpp"
#include "tree_serializer.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include "../common/transport.hpp"
#include "../common/utils.hpp"

SenderApp::SenderApp(SendConfig cfg, std::istream& lines_in)
    : cfg_(std::move(cfg))
    , lines_in_(lines_in)
{
    if (cfg_.operands.empty()) cfg_.operands.push_back(".");
}

int SenderApp::run() {
    u64 t0 = utils::now_ms();
    LOG_INFO("Sending to " + cfg_.dest_addr + " [" + layers::describe(cfg_.layers) + "]");

    transport::with_dial(cfg_.dest_addr, [this](TcpSocket& sock) {
        SocketWriter sink(sock);
        layers::with_send_layers(sink, cfg_.layers, [this](ByteWriter& out) {
            if (cfg_.lines_mode) send_lines(out);
            else                 send_tree(out);
        });
    });

    u64 elapsed = utils::now_ms() - t0;
    if (cfg_.lines_mode) {
        LOG_INFO("Sent " + std::to_string(entries_) + " lines");
    } else {
        LOG_INFO("Sent: " + utils::format_summary(entries_, bytes_, elapsed));
    }
    return 0;
}

void SenderApp::send_tree(ByteWriter& out) {
    TreeSerializer ser(out);
    for (const auto& op : cfg_.operands) {
        LOG_DEBUG("operand " + op);
        ser.add_operand(op);
    }
    ser.finish();

    entries_ = ser.entries();
    bytes_   = ser.payload_bytes();
    if (ser.skipped() > 0) {
        LOG_WARN("Skipped " + std::to_string(ser.skipped()) + " entries");
    }
}

void SenderApp::send_lines(ByteWriter& out) {
    std::string line;
    while (std::getline(lines_in_, line)) {
        line.push_back('\n');
        out.write(line.data(), line.size());
        out.flush();
        ++entries_;
        bytes_ += line.size();
    }
}
