// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef RC_CANCELLATIONTOKEN_HH_
#define RC_CANCELLATIONTOKEN_HH_

#include <chrono>
#include <condition_variable>
#include <mutex>

/** @brief A cooperative cancellation signal */
/** A rate control algorithm's run hook is handed a token and must return
 * promptly once the token is cancelled. The token's wait functions make it
 * easy to sleep between iterations while remaining responsive.
 */
class CancellationToken {
public:
    CancellationToken()
      : cancelled_(false)
    {
    }

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /** @brief Cancel. Idempotent. */
    void cancel(void)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            cancelled_ = true;
        }

        cond_.notify_all();
    }

    /** @brief Has the token been cancelled? */
    bool isCancelled(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return cancelled_;
    }

    /** @brief Wait until the token is cancelled */
    void wait(void) const
    {
        std::unique_lock<std::mutex> lock(mutex_);

        cond_.wait(lock, [this]{ return cancelled_; });
    }

    /** @brief Wait until the token is cancelled or the timeout elapses.
     * @return true if the token was cancelled
     */
    template<class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);

        return cond_.wait_for(lock, timeout, [this]{ return cancelled_; });
    }

private:
    mutable std::mutex mutex_;

    mutable std::condition_variable cond_;

    bool cancelled_;
};

#endif /* RC_CANCELLATIONTOKEN_HH_ */
