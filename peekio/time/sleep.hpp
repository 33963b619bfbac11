#pragma once

#include "peekio/debug.hpp"
#include "peekio/macros.hpp"

#include <chrono>
#include <coroutine>
#include <cstdint>

#include "uv.h"

namespace peekio::time {

using namespace std::chrono_literals;

namespace detail {

    struct SleepAwaiter {
        std::coroutine_handle<> handle_;
        uv_timer_t             *timer_;
        bool                    ready_{false};

        SleepAwaiter(uint64_t timeout)
            : timer_{new uv_timer_t{}} {
            uv_check(uv_timer_init(uv_default_loop(), timer_));
            timer_->data = this;
            uv_check(uv_timer_start(
                timer_,
                [](uv_timer_t *uv_timer) {
                    auto data = static_cast<SleepAwaiter *>(uv_timer->data);
                    if (data == nullptr) {
                        return;
                    }
                    data->ready_ = true;
                    if (data->handle_) {
                        data->handle_.resume();
                    }
                },
                timeout,
                0));
        }

        // the timer outlives the awaiter until libuv has closed it
        ~SleepAwaiter() {
            timer_->data = nullptr;
            uv_close(reinterpret_cast<uv_handle_t *>(timer_),
                     [](uv_handle_t *handle) {
                         delete reinterpret_cast<uv_timer_t *>(handle);
                     });
        }

        SleepAwaiter(const SleepAwaiter &) = delete;
        auto operator=(const SleepAwaiter &) = delete;

        auto await_ready() const noexcept -> bool {
            return ready_;
        }

        auto await_suspend(std::coroutine_handle<> handle) noexcept {
            handle_ = handle;
        }

        auto await_resume() noexcept {
            handle_ = nullptr;
        }
    };

} // namespace detail

[[REMEMBER_CO_AWAIT]]
static inline auto sleep(const std::chrono::milliseconds &duration) {
    return detail::SleepAwaiter{static_cast<uint64_t>(duration.count())};
}

} // namespace peekio::time
