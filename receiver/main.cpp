// ============================================================
// receiver/main.cpp -- treepipe-recv entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/passphrase.hpp"
#include "receiver_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <csignal>
#include <vector>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] <bind_addr>\n"
        << "\n"
        << "  bind_addr      address to listen on, host:port or :port (all interfaces)\n"
        << "\nOptions:\n"
        << "  -C, --dir DIR  destination directory (default: .)\n"
        << "  -z, --compress zstd compression (sender must agree)\n"
        << "  -s, --secure   prompt for passphrase, AES-256-GCM framing\n"
        << "  --lines        print received lines instead of extracting a tree\n"
        << "  --log FILE     also append log lines to FILE\n"
        << "  -v, --verbose  enable debug logging\n"
        << "  -h, --help     show this help\n"
        << "\nEnvironment:\n"
        << "  " << PASSPHRASE_ENV << "  passphrase for --secure (skips the prompt)\n"
        << "\nThe receiver starts first and accepts exactly one sender.\n"
        << "\nExample:\n"
        << "  " << prog << " -z -s -C /srv/backup :6969\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    signal(SIGPIPE, SIG_IGN);
#endif

    ReceiveConfig cfg;
    std::string log_file;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "-z") == 0 || std::strcmp(a, "--compress") == 0) {
            cfg.layers.use_compress = true;
        } else if (std::strcmp(a, "-s") == 0 || std::strcmp(a, "--secure") == 0) {
            cfg.layers.use_encrypt = true;
        } else if ((std::strcmp(a, "-C") == 0 || std::strcmp(a, "--dir") == 0) && i + 1 < argc) {
            cfg.dest_dir = argv[++i];
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

    if (positional.size() != 1) {
        print_usage(argv[0]);
        return 2;
    }
    cfg.bind_addr = positional[0];

    if (cfg.dest_dir.empty()) {
        std::cerr << "ERROR: Empty destination directory\n";
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

        ReceiverApp app(std::move(cfg));
        return app.run();
    } catch (const UsageError& e) {
        std::cerr << "treepipe: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "treepipe: " << e.what() << "\n";
        return 1;
    }
}
