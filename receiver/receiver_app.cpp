// ============================================================
// receiver_app.cpp -- treepipe-recv: accept one sender and
//   extract its archive (or print its lines)
// ============================================================

#include "receiver_app.hpp"
#include "tree_extractor.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include "../common/transport.hpp"
#include "../common/utils.hpp"

ReceiverApp::ReceiverApp(ReceiveConfig cfg, std::ostream& lines_out)
    : cfg_(std::move(cfg))
    , lines_out_(lines_out)
{
    if (cfg_.dest_dir.empty()) cfg_.dest_dir = ".";
}

int ReceiverApp::run(const std::function<void(u16)>& on_listening) {
    u64 t0 = 0;
    auto announce = [&](u16 port) {
        LOG_INFO("Listening on port " + std::to_string(port) +
                 " [" + layers::describe(cfg_.layers) + "]");
        if (on_listening) on_listening(port);
    };

    transport::with_listen(cfg_.bind_addr, [&](TcpSocket& sock) {
        LOG_INFO("Receiving from " + sock.peer_addr());
        t0 = utils::now_ms();
        SocketReader source(sock);
        layers::with_receive_layers(source, cfg_.layers, [this](ByteReader& in) {
            if (cfg_.lines_mode) receive_lines(in);
            else                 receive_tree(in);
        });
    }, announce);

    u64 elapsed = utils::now_ms() - t0;
    if (cfg_.lines_mode) {
        LOG_INFO("Received " + std::to_string(entries_) + " lines");
    } else {
        LOG_INFO("Received: " + utils::format_summary(entries_, bytes_, elapsed));
    }
    return 0;
}

void ReceiverApp::receive_tree(ByteReader& in) {
    TreeExtractor extractor(cfg_.dest_dir);
    extractor.extract(in);
    entries_ = extractor.entries();
    bytes_   = extractor.payload_bytes();

    // Consume the rest (compression trailer) so the sender's close is clean
    u8  scratch[4096];
    u64 trailing = 0;
    size_t n;
    while ((n = in.read(scratch, sizeof(scratch))) > 0) trailing += n;
    if (trailing > 0) {
        LOG_WARN("Ignored " + std::to_string(trailing) + " bytes after end of archive");
    }
}

void ReceiverApp::receive_lines(ByteReader& in) {
    std::string line;
    char c;
    // One byte at a time so every line is shown as soon as it arrives
    while (in.read(&c, 1) == 1) {
        bytes_ += 1;
        if (c != '\n') {
            line.push_back(c);
            continue;
        }
        lines_out_ << "RECEIVED: " << line << std::endl;
        line.clear();
        ++entries_;
    }
    if (!line.empty()) {
        lines_out_ << "RECEIVED: " << line << std::endl;
        ++entries_;
    }
}
