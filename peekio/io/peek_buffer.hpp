#pragma once

#include <algorithm>
#include <deque>
#include <span>
#include <vector>

namespace peekio::io {

/// Ordered holding area for bytes pulled from a source but not yet consumed.
///
///   front                                             back
///   +-----------------+------------+------------------+
///   | chunk0[head_..] |   chunk1   |      chunkN      |
///   +-----------------+------------+------------------+
///
/// Reading the chunks front to back (skipping the first `head_` bytes of the
/// front chunk) yields the buffered bytes in the order they were produced.
class PeekBuffer {
public:
    PeekBuffer() = default;

    PeekBuffer(PeekBuffer &&) noexcept = default;
    auto operator=(PeekBuffer &&) noexcept -> PeekBuffer & = default;

    // No copy
    PeekBuffer(const PeekBuffer &) = delete;
    auto operator=(const PeekBuffer &) = delete;

public:
    /// Appends bytes behind everything already buffered.
    auto push(std::span<const char> chunk) -> void {
        if (chunk.empty()) {
            return;
        }
        chunks_.emplace_back(chunk.begin(), chunk.end());
        size_ += chunk.size();
    }

    /// Puts bytes back in front of everything already buffered.
    auto push_front(std::span<const char> chunk) -> void {
        if (chunk.empty()) {
            return;
        }
        compact_front();
        chunks_.emplace_front(chunk.begin(), chunk.end());
        size_ += chunk.size();
    }

    /// Moves up to `dst.size()` bytes into `dst`, returns how many were moved.
    auto take(std::span<char> dst) -> std::size_t {
        std::size_t copied = 0;
        while (!chunks_.empty() && copied < dst.size()) {
            auto &front = chunks_.front();
            auto  available = front.size() - head_;
            auto  len = std::min(available, dst.size() - copied);
            std::copy_n(front.begin() + static_cast<std::ptrdiff_t>(head_),
                        len,
                        dst.begin() + static_cast<std::ptrdiff_t>(copied));
            copied += len;
            if (len == available) {
                chunks_.pop_front();
                head_ = 0;
            } else {
                // the remainder stays at the front for the next take()
                head_ += len;
            }
        }
        size_ -= copied;
        return copied;
    }

    [[nodiscard]]
    auto size() const noexcept -> std::size_t {
        return size_;
    }

    [[nodiscard]]
    auto empty() const noexcept -> bool {
        return size_ == 0;
    }

    [[nodiscard]]
    auto chunk_count() const noexcept -> std::size_t {
        return chunks_.size();
    }

    auto clear() noexcept -> void {
        chunks_.clear();
        head_ = 0;
        size_ = 0;
    }

private:
    // drops the consumed prefix of the front chunk so head_ can be reset
    auto compact_front() -> void {
        if (head_ == 0) {
            return;
        }
        auto &front = chunks_.front();
        front.erase(front.begin(),
                    front.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }

private:
    std::deque<std::vector<char>> chunks_;
    std::size_t                   head_{0};
    std::size_t                   size_{0};
};

} // namespace peekio::io
