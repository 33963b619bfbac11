#pragma once

#include "peekio/common/result.hpp"
#include "peekio/debug.hpp"
#include "peekio/io/push_source.hpp"
#include "peekio/log.hpp"
#include "peekio/macros.hpp"

#include <memory>
#include <vector>

#include "uv.h"

namespace peekio::net {

using namespace peekio::log;

/// ByteSource over a libuv stream handle (uv_pipe_t, uv_tcp_t, uv_tty_t).
///
/// Once started every chunk libuv delivers is pushed to the buffer, UV_EOF
/// ends the source and any other read status fails it. The handle is closed
/// with the source.
template <typename Handle>
class UvStreamSource final : public io::PushSource {
public:
    constexpr static std::size_t DEFAULT_CHUNK_SIZE{
        static_cast<std::size_t>(64 * 1024)};

public:
    explicit UvStreamSource(std::unique_ptr<Handle> handle,
                            std::size_t chunk_size = DEFAULT_CHUNK_SIZE)
        : handle_{std::move(handle)}
        , read_buf_(chunk_size) {
        handle_->data = this;
    }

    ~UvStreamSource() override {
        remove_listeners();
        if (handle_) {
            stop();
            handle_->data = nullptr;
            uv_close(reinterpret_cast<uv_handle_t *>(handle_.release()),
                     [](uv_handle_t *handle) {
                         delete reinterpret_cast<Handle *>(handle);
                     });
        }
    }

    // Delete copy
    UvStreamSource(const UvStreamSource &) = delete;
    auto operator=(const UvStreamSource &) -> UvStreamSource & = delete;
    // Delete move, libuv keeps a pointer to this object
    UvStreamSource(UvStreamSource &&) = delete;
    auto operator=(UvStreamSource &&) -> UvStreamSource & = delete;

public:
    [[nodiscard]]
    auto start() -> Result<void> {
        if (reading_) {
            return Result<void>{};
        }
        if (auto ret = uv_read_start(stream(), on_alloc, on_read); ret != 0) {
            console.error("Read start failed: {}", uv_strerror(ret));
            return unexpected{make_uv_error(ret)};
        }
        reading_ = true;
        return Result<void>{};
    }

    /// Stops reading and signals `close` to the reader.
    void close() {
        stop();
        io::PushSource::close();
    }

    [[nodiscard]]
    auto handle() noexcept -> Handle * {
        return handle_.get();
    }

private:
    auto stream() noexcept -> uv_stream_t * {
        return reinterpret_cast<uv_stream_t *>(handle_.get());
    }

    void stop() {
        if (reading_) {
            uv_check(uv_read_stop(stream()));
            reading_ = false;
        }
    }

    static void on_alloc(uv_handle_t *handle,
                         size_t       suggested_size,
                         uv_buf_t    *buf) {
        (void) suggested_size;
        auto self = static_cast<UvStreamSource *>(handle->data);
        *buf = uv_buf_init(self->read_buf_.data(),
                           static_cast<unsigned int>(self->read_buf_.size()));
    }

    static void on_read(uv_stream_t *stream, ssize_t nread, const uv_buf_t *buf) {
        auto self = static_cast<UvStreamSource *>(stream->data);
        if (self == nullptr) {
            return;
        }
        if (nread > 0) {
            self->push({buf->base, static_cast<std::size_t>(nread)});
        } else if (nread == UV_EOF) {
            LOG_DEBUG("stream reached EOF");
            self->stop();
            self->end();
        } else if (nread < 0) {
            console.error("Read error: {}",
                          uv_err_name(static_cast<int>(nread)));
            self->stop();
            self->fail(make_uv_error(static_cast<int>(nread)));
        }
        // nread == 0 is EAGAIN, nothing to do
    }

private:
    std::unique_ptr<Handle> handle_;
    std::vector<char>       read_buf_;
    bool                    reading_{false};
};

using PipeSource = UvStreamSource<uv_pipe_t>;
using TcpSource = UvStreamSource<uv_tcp_t>;

/// Wraps `fd` (a pipe, socket or fifo) in a started PipeSource on the
/// default loop.
[[nodiscard]]
static inline auto open_pipe(uv_file     fd,
                             std::size_t chunk_size
                             = PipeSource::DEFAULT_CHUNK_SIZE)
    -> Result<std::unique_ptr<PipeSource>> {
    auto pipe = std::make_unique<uv_pipe_t>();
    if (auto ret = uv_pipe_init(uv_default_loop(), pipe.get(), 0); ret != 0) {
        return unexpected{make_uv_error(ret)};
    }
    // from here on the handle belongs to the loop and is released by
    // uv_close()
    auto source = std::make_unique<PipeSource>(std::move(pipe), chunk_size);
    if (auto ret = uv_pipe_open(source->handle(), fd); ret != 0) {
        console.error("Open pipe failed: {}", uv_strerror(ret));
        return unexpected{make_uv_error(ret)};
    }
    if (auto ret = source->start(); !ret) {
        return unexpected{ret.error()};
    }
    return source;
}

} // namespace peekio::net
