// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// buffer_pool.cpp - Bounded lock-free pool of scratch byte buffers

#include <tagwire/buffer_pool.h>

namespace tagwire {

BufferPool::BufferPool(std::size_t capacity, std::size_t initial_size)
    : idle_(capacity), capacity_(capacity), initial_size_(initial_size) {}

BufferPool::~BufferPool() {
    idle_.consume_all([](ByteBuffer* buffer) { delete buffer; });
}

BufferPool::PooledBuffer BufferPool::acquire() {
    ByteBuffer* raw = nullptr;
    if (idle_.pop(raw)) {
        reused_.fetch_add(1, std::memory_order_relaxed);
        return PooledBuffer{this, std::unique_ptr<ByteBuffer>(raw)};
    }

    auto buffer = std::make_unique<ByteBuffer>();
    buffer->reserve(initial_size_);
    created_.fetch_add(1, std::memory_order_relaxed);
    return PooledBuffer{this, std::move(buffer)};
}

void BufferPool::release(std::unique_ptr<ByteBuffer> buffer) noexcept {
    if (buffer->capacity() > TAGWIRE_MAX_RETAINED_BUFFER) {
        discarded_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    buffer->clear();
    ByteBuffer* raw = buffer.release();
    // bounded_push never allocates: it fails once `capacity_` buffers are idle
    if (!idle_.bounded_push(raw)) {
        delete raw;
        discarded_.fetch_add(1, std::memory_order_relaxed);
    }
}

BufferPool::Stats BufferPool::stats() const noexcept {
    return Stats{created_.load(std::memory_order_relaxed),
                 reused_.load(std::memory_order_relaxed),
                 discarded_.load(std::memory_order_relaxed)};
}

BufferPool& default_buffer_pool() {
    static BufferPool pool;
    return pool;
}

} // namespace tagwire
