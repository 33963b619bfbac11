#pragma once

#include "peekio/common/result.hpp"
#include "peekio/coroutine/future.hpp"
#include "peekio/coroutine/task.hpp"
#include "peekio/debug.hpp"
#include "peekio/io/byte_source.hpp"
#include "peekio/io/peek_buffer.hpp"
#include "peekio/macros.hpp"

#include <memory>
#include <optional>
#include <span>

namespace peekio::io {

/// Pull-style reader over a push-style ByteSource.
///
/// `read()` first drains bytes left behind by earlier `peek()` calls, then
/// pulls the rest from the source. At most one source read is outstanding;
/// a second one issued while the first is pending is a usage bug and
/// terminates the process. The first `end`/`error`/`close` signal puts the
/// reader in its final state: the pending read is rejected with the reason
/// and later reads fail with it once the peek buffer is empty.
///
/// A `read()` that comes back shorter than requested means the stream ended
/// in the middle of it. Use `read_exact()` when that should be an error.
///
/// The source must outlive the reader. Only one coroutine may use a reader
/// at a time.
class StreamReader {
    struct PendingRequest {
        std::span<char>     buffer_;
        Future<std::size_t> future_{};
    };

public:
    explicit StreamReader(ByteSource &source)
        : source_{source} {
        source_.once_end(guarded([this] {
            on_termination(make_peekio_error(Error::EndOfStream));
        }));
        source_.once_error(guarded_error([this](Error error) {
            on_termination(error);
        }));
        source_.once_close(guarded([this] {
            on_termination(make_peekio_error(Error::AbruptClosure));
        }));
    }

    ~StreamReader() {
        source_.remove_listeners();
    }

    // Delete copy
    StreamReader(const StreamReader &) = delete;
    auto operator=(const StreamReader &) -> StreamReader & = delete;
    // Delete move
    StreamReader(StreamReader &&) = delete;
    auto operator=(StreamReader &&) -> StreamReader & = delete;

public:
    [[REMEMBER_CO_AWAIT]]
    auto read(std::span<char> buf, std::size_t offset, std::size_t length)
        -> Task<Result<std::size_t>> {
        if (length == 0) {
            co_return std::size_t{0};
        }
        if (offset > buf.size() || length > buf.size() - offset) {
            co_return unexpected{make_peekio_error(Error::InvalidArgument)};
        }
        if (peek_buffer_.empty() && end_of_stream_) {
            co_return unexpected{termination_.value()};
        }

        auto dst = buf.subspan(offset, length);
        auto bytes_read = peek_buffer_.take(dst);
        if (bytes_read < length && !end_of_stream_) {
            auto ret = co_await read_from_source(dst.subspan(bytes_read));
            if (!ret) {
                // bytes already taken from the peek buffer are not lost to
                // a normal end
                if (bytes_read > 0
                    && ret.error() == make_peekio_error(Error::EndOfStream)) {
                    co_return bytes_read;
                }
                co_return ret;
            }
            bytes_read += ret.value();
        }
        co_return bytes_read;
    }

    [[REMEMBER_CO_AWAIT]]
    auto read(std::span<char> buf) -> Task<Result<std::size_t>> {
        return read(buf, 0, buf.size());
    }

    /// Same as read(), but the bytes stay queued for the next read/peek.
    [[REMEMBER_CO_AWAIT]]
    auto peek(std::span<char> buf, std::size_t offset, std::size_t length)
        -> Task<Result<std::size_t>> {
        auto ret = co_await read(buf, offset, length);
        if (ret) {
            peek_buffer_.push_front(buf.subspan(offset, ret.value()));
        }
        co_return ret;
    }

    [[REMEMBER_CO_AWAIT]]
    auto peek(std::span<char> buf) -> Task<Result<std::size_t>> {
        return peek(buf, 0, buf.size());
    }

    /// Fills `buf` completely. EndOfStream when nothing was left,
    /// UnexpectedEOF when the stream ended part way.
    [[REMEMBER_CO_AWAIT]]
    auto read_exact(std::span<char> buf) -> Task<Result<void>> {
        auto ret = co_await read(buf);
        if (!ret) {
            co_return unexpected{ret.error()};
        }
        if (ret.value() < buf.size()) {
            co_return unexpected{make_peekio_error(Error::UnexpectedEOF)};
        }
        co_return Result<void>{};
    }

    [[REMEMBER_CO_AWAIT]]
    auto peek_exact(std::span<char> buf) -> Task<Result<void>> {
        auto ret = co_await peek(buf);
        if (!ret) {
            co_return unexpected{ret.error()};
        }
        if (ret.value() < buf.size()) {
            co_return unexpected{make_peekio_error(Error::UnexpectedEOF)};
        }
        co_return Result<void>{};
    }

public:
    [[nodiscard]]
    auto is_end_of_stream() const noexcept -> bool {
        return end_of_stream_;
    }

    /// Bytes peeked but not yet consumed.
    [[nodiscard]]
    auto buffered() const noexcept -> std::size_t {
        return peek_buffer_.size();
    }

private:
    [[REMEMBER_CO_AWAIT]]
    auto read_from_source(std::span<char> dst) -> Task<Result<std::size_t>> {
        if (pending_.has_value()) [[unlikely]] {
            LOG_FATAL("{}: a source read of {} bytes is already pending",
                      make_peekio_error(Error::ConcurrentAccessViolation)
                          .message(),
                      pending_->buffer_.size());
        }

        if (auto len = source_.try_read(dst); len > 0) {
            co_return len;
        }
        if (end_of_stream_) {
            // terminated by the try_read() above
            co_return unexpected{termination_.value()};
        }

        auto future = pending_.emplace(PendingRequest{dst}).future_;
        LOG_TRACE("waiting for {} bytes", dst.size());
        source_.once_readable(guarded([this] {
            on_readable();
        }));
        co_return co_await future;
    }

    void on_readable() {
        if (!pending_.has_value()) {
            // already rejected by a termination signal
            return;
        }
        // The slot is free while the source runs and before the future
        // settles, the resumed reader may issue its next read right away.
        auto request = std::move(pending_).value();
        pending_.reset();

        if (auto len = source_.try_read(request.buffer_); len > 0) {
            request.future_.resolve(len);
            return;
        }
        if (end_of_stream_) {
            request.future_.reject(termination_.value());
            return;
        }
        pending_.emplace(std::move(request));
        source_.once_readable(guarded([this] {
            on_readable();
        }));
    }

    void on_termination(Error reason) {
        if (!end_of_stream_) {
            LOG_DEBUG("stream terminated: {}", reason.message());
            end_of_stream_ = true;
            termination_ = reason;
        }
        if (!pending_.has_value()) {
            return;
        }
        auto request = std::move(pending_).value();
        pending_.reset();
        request.future_.reject(reason);
    }

    // Listener lists may already be moved out of the source when this
    // reader goes away, so every callback checks the reader is still alive.
    template <typename Func>
    auto guarded(Func func) -> ByteSource::Callback {
        return [alive = std::weak_ptr<bool>{alive_}, func = std::move(func)] {
            if (!alive.expired()) {
                func();
            }
        };
    }

    template <typename Func>
    auto guarded_error(Func func) -> ByteSource::ErrorCallback {
        return [alive = std::weak_ptr<bool>{alive_},
                func = std::move(func)](Error error) {
            if (!alive.expired()) {
                func(error);
            }
        };
    }

private:
    ByteSource                   &source_;
    PeekBuffer                    peek_buffer_;
    std::optional<PendingRequest> pending_{std::nullopt};
    std::optional<Error>          termination_{std::nullopt};
    bool                          end_of_stream_{false};
    std::shared_ptr<bool>         alive_{std::make_shared<bool>(true)};
};

} // namespace peekio::io
