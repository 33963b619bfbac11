#pragma once

#include "peekio/common/result.hpp"
#include "peekio/debug.hpp"
#include "peekio/macros.hpp"

#include <coroutine>
#include <memory>
#include <optional>
#include <utility>

namespace peekio {

/// Single-assignment result cell with one consumer.
///
/// The first `resolve()`/`reject()` fixes the outcome, later calls return
/// false and change nothing. Copies share the same cell, so the producer can
/// keep one copy while the consumer awaits another. Settling resumes the
/// waiting coroutine inline, on the settling call stack.
template <typename T>
class Future {
    struct State {
        std::optional<Result<T>> result_{std::nullopt};
        std::coroutine_handle<> waiter_{nullptr};
    };

public:
    Future()
        : state_{std::make_shared<State>()} {}

public:
    auto resolve(T value) -> bool {
        return settle(Result<T>{std::move(value)});
    }

    auto reject(Error error) -> bool {
        return settle(Result<T>{unexpected{error}});
    }

    [[nodiscard]]
    auto is_settled() const noexcept -> bool {
        return state_->result_.has_value();
    }

    [[REMEMBER_CO_AWAIT]]
    auto operator co_await() const noexcept {
        struct FutureAwaiter {
            std::shared_ptr<State> state_;

            auto await_ready() const noexcept -> bool {
                return state_->result_.has_value();
            }

            auto await_suspend(std::coroutine_handle<> handle) noexcept {
                ASSERT_MSG(state_->waiter_ == nullptr,
                           "future awaited twice");
                state_->waiter_ = handle;
            }

            auto await_resume() noexcept -> Result<T> {
                state_->waiter_ = nullptr;
                return std::move(state_->result_).value();
            }
        };
        return FutureAwaiter{state_};
    }

private:
    auto settle(Result<T> &&result) -> bool {
        if (state_->result_.has_value()) {
            return false;
        }
        state_->result_.emplace(std::move(result));
        if (auto waiter = std::exchange(state_->waiter_, nullptr)) {
            waiter.resume();
        }
        return true;
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace peekio
