// ============================================================
// sender/main.cpp -- treepipe-send entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/passphrase.hpp"
#include "sender_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <vector>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] <dest_addr> [path...]\n"
        << "\n"
        << "  dest_addr      receiver address, host:port (start treepipe-recv first)\n"
        << "  path           files or directories to send (default: .)\n"
        << "\nOptions:\n"
        << "  -z, --compress zstd compression (receiver must agree)\n"
        << "  -s, --secure   prompt for passphrase, AES-256-GCM framing\n"
        << "  --chunk N      plaintext bytes per encrypted frame (default: 1024)\n"
        << "  --lines        send stdin line by line instead of a tree\n"
        << "  --log FILE     also append log lines to FILE\n"
        << "  -v, --verbose  enable debug logging\n"
        << "  -h, --help     show this help\n"
        << "\nEnvironment:\n"
        << "  " << PASSPHRASE_ENV << "  passphrase for --secure (skips the prompt)\n"
        << "\nExample:\n"
        << "  " << prog << " -z -s 192.168.1.5:6969 photos/ notes.txt\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    // Broken connections surface as EPIPE, not a signal
    signal(SIGPIPE, SIG_IGN);
#endif

    SendConfig cfg;
    std::string log_file;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "-z") == 0 || std::strcmp(a, "--compress") == 0) {
            cfg.layers.use_compress = true;
        } else if (std::strcmp(a, "-s") == 0 || std::strcmp(a, "--secure") == 0) {
            cfg.layers.use_encrypt = true;
        } else if (std::strcmp(a, "--chunk") == 0 && i + 1 < argc) {
            long n = std::atol(argv[++i]);
            if (n < 64 || n > 1024 * 1024) {
                std::cerr << "ERROR: --chunk must be 64-1048576\n";
                return 2;
            }
            cfg.layers.chunk_capacity = (size_t)n;
        } else if (std::strcmp(a, "--lines") == 0) {
            cfg.lines_mode = true;
        } else if (std::strcmp(a, "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(a, "-v") == 0 || std::strcmp(a, "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (a[0] == '-' && a[1] != '\0') {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            positional.push_back(a);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 2;
    }
    cfg.dest_addr = positional[0];
    cfg.operands.assign(positional.begin() + 1, positional.end());

    for (const auto& op : cfg.operands) {
        if (op.empty()) {
            std::cerr << "ERROR: Empty path operand\n";
            return 2;
        }
    }
    if (cfg.lines_mode && !cfg.operands.empty()) {
        std::cerr << "ERROR: --lines takes no paths\n";
        return 2;
    }
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 2;
    }

    try {
        if (cfg.layers.use_encrypt) {
            cfg.layers.key = crypto::derive_key(crypto::KEY_DOMAIN_TAG, acquire_passphrase());
        }

        SenderApp app(std::move(cfg));
        return app.run();
    } catch (const UsageError& e) {
        std::cerr << "treepipe: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "treepipe: " << e.what() << "\n";
        return 1;
    }
}
