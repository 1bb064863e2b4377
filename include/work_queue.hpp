/**
 * @file work_queue.hpp
 * @brief Bounded multi-producer/multi-consumer queue and reusable buffer pool.
 */

#ifndef WORK_QUEUE_HPP
#define WORK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief Blocking queue with a fixed capacity.
 *
 * push() blocks while the queue is full, pop() blocks while it is empty. After
 * close() producers are refused and consumers drain what is left, then receive
 * std::nullopt.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Adds an item, waiting for room.
     *
     * @return false if the queue was closed.
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Takes the oldest item, waiting for one to arrive.
     *
     * @return The item, or std::nullopt once the queue is closed and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

/**
 * @brief Pool of fixed-size byte buffers shared by worker threads.
 *
 * acquire() hands out a lease that gives its buffer back when destroyed, whether the
 * work it was used for succeeded or not.
 */
class BufferPool {
public:
    class Lease {
    public:
        Lease(BufferPool& pool, std::unique_ptr<std::vector<char>> buffer) : pool_(&pool), buffer_(std::move(buffer)) {}
        Lease(Lease&&) noexcept = default;
        Lease& operator=(Lease&&) noexcept = default;
        ~Lease() {
            if (buffer_) {
                pool_->release(std::move(buffer_));
            }
        }

        char* data() { return buffer_->data(); }
        std::size_t size() const { return buffer_->size(); }

    private:
        BufferPool* pool_;
        std::unique_ptr<std::vector<char>> buffer_;
    };

    explicit BufferPool(std::size_t bufferSize) : bufferSize_(bufferSize) {}

    Lease acquire() {
        std::unique_ptr<std::vector<char>> buffer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!free_.empty()) {
                buffer = std::move(free_.back());
                free_.pop_back();
            }
        }
        if (!buffer) {
            buffer = std::make_unique<std::vector<char>>(bufferSize_);
        }
        return Lease(*this, std::move(buffer));
    }

    std::size_t bufferSize() const { return bufferSize_; }

    std::size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return free_.size();
    }

private:
    void release(std::unique_ptr<std::vector<char>> buffer) {
        std::lock_guard<std::mutex> lock(mutex_);
        free_.push_back(std::move(buffer));
    }

    std::size_t bufferSize_;
    std::vector<std::unique_ptr<std::vector<char>>> free_;
    mutable std::mutex mutex_;
};

#endif // WORK_QUEUE_HPP
