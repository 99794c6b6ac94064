// ============================================================
// passphrase.cpp -- Obtain the shared passphrase for --secure
// ============================================================

#include "passphrase.hpp"
#include "platform.hpp"
#include "errors.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#ifndef _WIN32
#  include <stdio.h>
#  include <termios.h>
#endif

static void strip_newline(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
}

#ifdef _WIN32

static std::string prompt_hidden(const char* prompt) {
    HANDLE in = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    bool console = GetConsoleMode(in, &mode) != 0;
    if (console) SetConsoleMode(in, mode & ~(DWORD)ENABLE_ECHO_INPUT);

    std::cerr << prompt << std::flush;
    std::string line;
    std::getline(std::cin, line);
    std::cerr << "\n";

    if (console) SetConsoleMode(in, mode);
    return line;
}

#else

// Restores the saved terminal attributes on scope exit
struct EchoOff {
    int fd;
    termios saved{};
    bool active{false};

    explicit EchoOff(int f) : fd(f) {
        if (tcgetattr(fd, &saved) != 0) return;
        termios quiet = saved;
        quiet.c_lflag &= ~(tcflag_t)ECHO;
        active = tcsetattr(fd, TCSAFLUSH, &quiet) == 0;
    }
    ~EchoOff() {
        if (active) tcsetattr(fd, TCSAFLUSH, &saved);
    }
};

static std::string prompt_hidden(const char* prompt) {
    // Prefer the controlling terminal so stdin stays free for line mode
    FILE* tty = std::fopen("/dev/tty", "r+");
    FILE* in  = tty ? tty : stdin;
    FILE* out = tty ? tty : stderr;

    std::string line;
    {
        EchoOff echo(fileno(in));
        std::fputs(prompt, out);
        std::fflush(out);

        int c;
        while ((c = std::fgetc(in)) != EOF && c != '\n') {
            line.push_back((char)c);
        }
        std::fputs("\n", out);
    }

    if (tty) std::fclose(tty);
    return line;
}

#endif

std::string acquire_passphrase() {
    std::string pass;
    if (const char* env = std::getenv(PASSPHRASE_ENV)) {
        pass = env;
    } else {
        pass = prompt_hidden("Passphrase: ");
    }
    strip_newline(pass);
    if (pass.empty()) {
        throw UsageError("empty passphrase");
    }
    return pass;
}
