#pragma once

// ============================================================
// scoped_close.hpp -- Run a body, then always close a resource
//
// The close step runs on every exit path of the body. When both
// fail, the body's exception is the one propagated; the later
// close error is only logged.
// ============================================================

#include "logger.hpp"
#include <exception>
#include <string>
#include <utility>

template <typename Body, typename Closer>
void run_then_close(Body&& body, Closer&& close) {
    std::exception_ptr first;
    try {
        std::forward<Body>(body)();
    } catch (...) {
        first = std::current_exception();
    }

    try {
        std::forward<Closer>(close)();
    } catch (const std::exception& e) {
        if (!first) {
            first = std::current_exception();
        } else {
            LOG_DEBUG(std::string("close error after earlier failure: ") + e.what());
        }
    }

    if (first) std::rethrow_exception(first);
}
