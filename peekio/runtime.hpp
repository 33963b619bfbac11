#pragma once

#include "peekio/coroutine/task.hpp"
#include "peekio/debug.hpp"
#include "peekio/log.hpp"

#include "uv.h"

namespace peekio {

using namespace peekio::log;

namespace detail {
    static inline auto run_loop() -> int {
        int ret = uv_run(uv_default_loop(), UV_RUN_DEFAULT);
        uv_check(uv_loop_close(uv_default_loop()));
        return ret;
    }
} // namespace detail

/// Starts `first_coro` and runs the default loop until no handle is left.
static inline auto block_on(Task<> &&first_coro) {
    auto handle = std::move(first_coro).take();
    LOG_DEBUG("loop run ...");
    handle.resume();

#if !defined(NDEBUG)
    if (console.level() <= LogLevel::TRACE) {
        uv_print_all_handles(uv_default_loop(), stderr);
    }
#endif
    peekio::detail::run_loop();
    LOG_DEBUG("loop end.");
}

/// Starts `task` detached, it runs until its first suspension point.
static inline auto spawn(Task<> &&task) {
    auto handle = std::move(task).take();
    handle.resume();
}

} // namespace peekio
