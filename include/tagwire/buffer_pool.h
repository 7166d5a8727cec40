// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file buffer_pool.h
/// @brief Bounded lock-free pool of scratch byte buffers
///
/// Encode, compression and the streaming JSON parser borrow their scratch
/// buffers from a pool instead of allocating a fresh vector for every call.
///
/// Architecture:
/// @code
///     +------------------------------------------------------+
///     |                     BufferPool                       |
///     +------------------------------------------------------+
///     | boost::lockfree::stack<ByteBuffer*>  (LIFO, bounded) |
///     |   +-- at most capacity() idle buffers                |
///     | stats (created, reused, discarded) - atomics         |
///     +------------------------------------------------------+
/// @endcode
///
/// - acquire() pops an idle buffer (or allocates one) and hands it out as a
///   move-only PooledBuffer; the buffer is always empty when handed out.
/// - The PooledBuffer destructor pushes the buffer back. Buffers that grew
///   past TAGWIRE_MAX_RETAINED_BUFFER, or that do not fit because the pool
///   is full, are freed instead.
///
/// Usage:
/// @code
///     auto scratch = default_buffer_pool().acquire();
///     scratch->insert(scratch->end(), data.begin(), data.end());
///     ByteBuffer result = scratch.take();   // or let it return to the pool
/// @endcode

#pragma once

#include "tagwire_config.h"
#include "api.h"
#include "value_fwd.h"

#include <boost/lockfree/stack.hpp>

#include <atomic>
#include <cstddef>
#include <memory>

namespace tagwire {

class TAGWIRE_API BufferPool {
public:
    //=========================================================================
    // Lease
    //=========================================================================

    /// @brief RAII checkout of one scratch buffer
    class TAGWIRE_API PooledBuffer {
    public:
        PooledBuffer(PooledBuffer&& other) noexcept
            : pool_(other.pool_), buffer_(std::move(other.buffer_)) {}

        PooledBuffer& operator=(PooledBuffer&& other) noexcept {
            if (this != &other) {
                give_back();
                pool_ = other.pool_;
                buffer_ = std::move(other.buffer_);
            }
            return *this;
        }

        PooledBuffer(const PooledBuffer&) = delete;
        PooledBuffer& operator=(const PooledBuffer&) = delete;

        ~PooledBuffer() { give_back(); }

        [[nodiscard]] ByteBuffer& operator*() noexcept { return *buffer_; }
        [[nodiscard]] ByteBuffer* operator->() noexcept { return buffer_.get(); }
        [[nodiscard]] ByteBuffer& get() noexcept { return *buffer_; }

        /// Moves the contents out; the emptied buffer still returns to the pool
        [[nodiscard]] ByteBuffer take() {
            ByteBuffer out = std::move(*buffer_);
            buffer_->clear();
            return out;
        }

    private:
        friend class BufferPool;
        PooledBuffer(BufferPool* pool, std::unique_ptr<ByteBuffer> buffer) noexcept
            : pool_(pool), buffer_(std::move(buffer)) {}

        void give_back() noexcept {
            if (buffer_) pool_->release(std::move(buffer_));
        }

        BufferPool* pool_;
        std::unique_ptr<ByteBuffer> buffer_;
    };

    struct Stats {
        std::size_t created = 0;    ///< buffers allocated because the pool was empty
        std::size_t reused = 0;     ///< acquisitions served from the pool
        std::size_t discarded = 0;  ///< returned buffers freed instead of pooled
    };

    /// @param capacity     Maximum number of idle buffers kept
    /// @param initial_size Capacity reserved by newly allocated buffers
    explicit BufferPool(std::size_t capacity = TAGWIRE_POOL_CAPACITY,
                        std::size_t initial_size = TAGWIRE_SCRATCH_BUFFER_SIZE);
    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    [[nodiscard]] PooledBuffer acquire();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t initial_size() const noexcept { return initial_size_; }
    [[nodiscard]] Stats stats() const noexcept;

private:
    void release(std::unique_ptr<ByteBuffer> buffer) noexcept;

    boost::lockfree::stack<ByteBuffer*> idle_;
    std::size_t capacity_;
    std::size_t initial_size_;

    std::atomic<std::size_t> created_{0};
    std::atomic<std::size_t> reused_{0};
    std::atomic<std::size_t> discarded_{0};
};

/// Process-wide pool shared by the codec
[[nodiscard]] TAGWIRE_API BufferPool& default_buffer_pool();

} // namespace tagwire
