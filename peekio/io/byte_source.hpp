#pragma once

#include "peekio/common/result.hpp"

#include <functional>
#include <span>

namespace peekio::io {

/// Push-style producer of bytes.
///
/// `try_read()` never blocks: it fills `buf` completely when that many bytes
/// are buffered, returns fewer only once the source has ended, and returns 0
/// when nothing can be delivered right now. Readiness is reported through
/// one-shot `readable` listeners that must be re-registered after they fire.
/// `end`, `error` and `close` fire at most once each; registering for one of
/// them after it fired invokes the callback immediately.
class ByteSource {
public:
    using Callback = std::function<void()>;
    using ErrorCallback = std::function<void(Error)>;

public:
    virtual ~ByteSource() = default;

    [[nodiscard]]
    virtual auto try_read(std::span<char> buf) -> std::size_t = 0;

    virtual void once_readable(Callback callback) = 0;
    virtual void once_end(Callback callback) = 0;
    virtual void once_error(ErrorCallback callback) = 0;
    virtual void once_close(Callback callback) = 0;

    virtual void remove_listeners() = 0;
};

} // namespace peekio::io
