#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

namespace ktree::events {

// Fixed-capacity ring buffer, safe for multiple producers and consumers.
// Capacity must be > 0 (not required to be power-of-two).
template <typename T> class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : buf_(capacity ? capacity : 1), cap_(capacity ? capacity : 1) {}

    bool try_push(const T& v) {
        std::lock_guard<std::mutex> lk(mu_);
        if (size_ == cap_)
            return false; // full
        buf_[head_] = v;
        head_ = inc(head_);
        ++size_;
        return true;
    }
    bool try_push(T&& v) {
        std::lock_guard<std::mutex> lk(mu_);
        if (size_ == cap_)
            return false; // full
        buf_[head_] = std::move(v);
        head_ = inc(head_);
        ++size_;
        return true;
    }
    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (size_ == 0)
            return false; // empty
        out = std::move(buf_[tail_]);
        tail_ = inc(tail_);
        --size_;
        return true;
    }
    bool empty() const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return size_ == 0;
    }
    bool full() const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return size_ == cap_;
    }
    std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        return size_;
    }
    std::size_t capacity() const noexcept { return cap_; }

private:
    std::size_t inc(std::size_t i) const noexcept { return (++i == cap_) ? 0 : i; }
    mutable std::mutex mu_;
    std::vector<T> buf_;
    const std::size_t cap_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t size_{0};
};

} // namespace ktree::events
