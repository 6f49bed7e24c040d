// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef SAFEQUEUE_H_
#define SAFEQUEUE_H_

#include <condition_variable>
#include <deque>
#include <mutex>

/** @brief A thread-safe queue. */
/** A SafeQueue is a thread-safe FIFO queue. Any call to pop will block until an
 * element is inserted or until the queue is closed by a call to close. Once
 * the queue has been closed, no further elements are accepted, but elements
 * that were already queued can still be popped. This lets a consumer drain the
 * queue before it exits.
 */
template<typename T, class Container = std::deque<T>>
class SafeQueue {
public:
    using container_type = Container;

    SafeQueue()
      : closed_(false)
    {
    }

    ~SafeQueue()
    {
        close();
    }

    SafeQueue(const SafeQueue&) = delete;
    SafeQueue(SafeQueue&&) = delete;

    SafeQueue& operator=(const SafeQueue&) = delete;
    SafeQueue& operator=(SafeQueue&&) = delete;

    /** @brief Close the queue. */
    /** Waiting consumers are woken. Elements pushed after the queue is closed
     * are discarded.
     */
    void close(void)
    {
        {
            std::lock_guard<std::mutex> lock(m_);

            closed_ = true;
        }

        cond_.notify_all();
    }

    /** @brief Push an element on the end of the queue.
     * @return true if the element was queued, false if the queue is closed.
     */
    bool push(T&& val)
    {
        {
            std::lock_guard<std::mutex> lock(m_);

            if (closed_)
                return false;

            q_.push_back(std::move(val));
        }

        cond_.notify_one();
        return true;
    }

    /** @brief Pop the first element of the queue, waiting for one if necessary.
     * @param val Reference to location where popped value should be moved.
     * @return true if a value was popped, false if the queue is closed and
     * empty.
     */
    bool pop(T& val)
    {
        std::unique_lock<std::mutex> lock(m_);

        cond_.wait(lock, [this]{ return closed_ || !q_.empty(); });

        return popLocked(val);
    }

private:
    /** @brief Mutex protecting the queue. */
    mutable std::mutex m_;

    /** @brief Flag indicating that the queue has been closed. */
    bool closed_;

    /** @brief Condition variable signaled on push and close. */
    std::condition_variable cond_;

    /** @brief The queue itself. */
    container_type q_;

    /** @brief Pop the front element. Caller must hold m_. */
    bool popLocked(T& val)
    {
        if (q_.empty())
            return false;

        val = std::move(q_.front());
        q_.pop_front();
        return true;
    }
};

#endif /* SAFEQUEUE_H_ */
