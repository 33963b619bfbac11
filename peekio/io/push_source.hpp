#pragma once

#include "peekio/debug.hpp"
#include "peekio/io/byte_source.hpp"
#include "peekio/io/peek_buffer.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace peekio::io {

/// ByteSource fed by producer code.
///
/// Pushed chunks are buffered until a reader takes them. `end()` lets the
/// reader drain what is left before the `end` signal fires; `fail()` and
/// `close()` discard buffered bytes and terminate at once. `end` and `error`
/// are always followed by `close`; calls after termination are ignored.
class PushSource : public ByteSource {
public:
    PushSource() = default;

    // No copy, listeners capture their owners by address
    PushSource(const PushSource &) = delete;
    auto operator=(const PushSource &) = delete;

public:
    [[nodiscard]]
    auto try_read(std::span<char> buf) -> std::size_t override {
        if (buffer_.size() < buf.size() && !ended_) {
            return 0;
        }
        auto len = buffer_.take(buf);
        maybe_emit_end();
        return len;
    }

    void once_readable(Callback callback) override {
        readable_listeners_.push_back(std::move(callback));
    }

    void once_end(Callback callback) override {
        if (end_emitted_) {
            callback();
            return;
        }
        end_listeners_.push_back(std::move(callback));
    }

    void once_error(ErrorCallback callback) override {
        if (error_.has_value()) {
            callback(error_.value());
            return;
        }
        error_listeners_.push_back(std::move(callback));
    }

    void once_close(Callback callback) override {
        if (closed_) {
            callback();
            return;
        }
        close_listeners_.push_back(std::move(callback));
    }

    void remove_listeners() override {
        readable_listeners_.clear();
        end_listeners_.clear();
        error_listeners_.clear();
        close_listeners_.clear();
    }

public:
    /// Returns false when the source has already ended, failed or closed.
    auto push(std::span<const char> chunk) -> bool {
        if (ended_ || error_.has_value() || closed_) {
            LOG_WARN("push of {} bytes after termination dropped",
                     chunk.size());
            return false;
        }
        if (chunk.empty()) {
            return true;
        }
        buffer_.push(chunk);
        LOG_TRACE("pushed {} bytes, {} buffered", chunk.size(), buffer_.size());
        emit(readable_listeners_);
        return true;
    }

    /// No more data will be pushed.
    void end() {
        if (ended_ || error_.has_value() || closed_) {
            return;
        }
        ended_ = true;
        if (buffer_.empty()) {
            maybe_emit_end();
            return;
        }
        // a waiting reader collects the short tail, `end` follows from
        // try_read() once the buffer is drained
        emit(readable_listeners_);
    }

    void fail(Error error) {
        if (error_.has_value() || closed_) {
            return;
        }
        LOG_DEBUG("source failed: {}", error.message());
        buffer_.clear();
        error_ = error;
        closed_ = true;
        auto error_listeners = std::exchange(error_listeners_, {});
        auto close_listeners = std::exchange(close_listeners_, {});
        for (auto &listener : error_listeners) {
            listener(error);
        }
        for (auto &listener : close_listeners) {
            listener();
        }
    }

    void close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        buffer_.clear();
        emit(close_listeners_);
    }

    [[nodiscard]]
    auto buffered() const noexcept -> std::size_t {
        return buffer_.size();
    }

    [[nodiscard]]
    auto is_closed() const noexcept -> bool {
        return closed_;
    }

private:
    void maybe_emit_end() {
        if (!ended_ || end_emitted_ || closed_ || !buffer_.empty()) {
            return;
        }
        end_emitted_ = true;
        closed_ = true;
        auto end_listeners = std::exchange(end_listeners_, {});
        auto close_listeners = std::exchange(close_listeners_, {});
        for (auto &listener : end_listeners) {
            listener();
        }
        for (auto &listener : close_listeners) {
            listener();
        }
    }

    // Listeners are moved out first, so the ones registered while emitting
    // wait for the next signal. A listener may resume a coroutine that
    // destroys this source, nothing touches members after the loop.
    static void emit(std::vector<Callback> &listeners) {
        auto fired = std::exchange(listeners, {});
        for (auto &listener : fired) {
            listener();
        }
    }

private:
    PeekBuffer                 buffer_;
    std::vector<Callback>      readable_listeners_;
    std::vector<Callback>      end_listeners_;
    std::vector<ErrorCallback> error_listeners_;
    std::vector<Callback>      close_listeners_;
    std::optional<Error>       error_{std::nullopt};
    bool                       ended_{false};
    bool                       end_emitted_{false};
    bool                       closed_{false};
};

} // namespace peekio::io
