// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef RC_CONTROLTASK_HH_
#define RC_CONTROLTASK_HH_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "Errors.hh"
#include "SafeQueue.hh"
#include "rc/CancellationToken.hh"
#include "rc/RateControlAlgorithm.hh"

/** @brief The lifecycle of a rate control algorithm attached to a station */
/** State transitions are made synchronously by the public methods, so callers
 * observe the new state immediately. The algorithm's hooks are executed, in
 * the order the transitions were requested, by a single worker thread that
 * reads from a control channel. Pausing or stopping cancels the token handed
 * to the algorithm's run hook.
 *
 *   Unconfigured -> Configuring -> Running <-> Paused
 *   any state -> Stopped
 */
class ControlTask : public std::enable_shared_from_this<ControlTask> {
public:
    enum State {
        /** @brief Attached but not yet started */
        kUnconfigured = 0,
        /** @brief The configure hook is executing */
        kConfiguring,
        /** @brief The run hook is executing */
        kRunning,
        /** @brief The run hook has been cancelled pending resume */
        kPaused,
        /** @brief Terminal */
        kStopped
    };

    ControlTask(std::weak_ptr<Station> sta,
                std::shared_ptr<RateControlAlgorithm> alg,
                const AlgorithmOptions &opts);

    ~ControlTask();

    ControlTask() = delete;
    ControlTask(const ControlTask&) = delete;
    ControlTask(ControlTask&&) = delete;

    ControlTask& operator=(const ControlTask&) = delete;
    ControlTask& operator=(ControlTask&&) = delete;

    /** @brief Get the current state */
    State getState(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return state_;
    }

    /** @brief Get the error that stopped the task, if any */
    std::optional<ErrorCode> getError(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return error_;
    }

    /** @brief Get a description of the error that stopped the task */
    std::string getErrorMessage(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return error_msg_;
    }

    /** @brief Get the algorithm */
    const std::shared_ptr<RateControlAlgorithm> &getAlgorithm(void) const
    {
        return alg_;
    }

    /** @brief Get the algorithm options */
    const AlgorithmOptions &getOptions(void) const
    {
        return opts_;
    }

    /** @brief Start configuring.
     * @return true if the task was Unconfigured
     */
    bool start(void);

    /** @brief Pause a running task.
     * @return true if the task was Running
     */
    bool pause(void);

    /** @brief Resume a paused task.
     * The task moves to Running if the algorithm has pause and resume hooks,
     * otherwise it is configured again from scratch.
     * @return true if the task was Paused
     */
    bool resume(void);

    /** @brief Suspend the task because its station went away.
     * A running task is paused. A task that is still configuring is stopped.
     * @return The resulting state
     */
    State suspend(void);

    /** @brief Stop the task. Idempotent. */
    void stop(void);

    /** @brief Wait until the task is no longer Configuring.
     * @return true if the task left the Configuring state in time
     */
    bool waitSettled(std::chrono::duration<double> timeout);

    /** @brief Wait for the worker thread to exit after a stop.
     * If the worker does not exit within the timeout, it is detached and will
     * exit once the algorithm honors its cancellation.
     * @return true if the worker exited
     */
    bool join(std::chrono::duration<double> timeout);

private:
    /** @brief Control channel message */
    struct TaskMsg {
        enum Kind {
            kConfigure = 0,
            kResume,
            kPause,
            kStop
        };

        Kind kind;

        /** @brief Token for the run that follows a resume */
        std::shared_ptr<CancellationToken> token;
    };

    /** @brief The station we control */
    std::weak_ptr<Station> sta_;

    /** @brief The algorithm */
    std::shared_ptr<RateControlAlgorithm> alg_;

    /** @brief Algorithm options */
    const AlgorithmOptions opts_;

    /** @brief Description of this task for logging */
    const std::string label_;

    /** @brief Does the algorithm have pause and resume hooks? */
    const bool can_pause_;

    /** @brief Mutex protecting task state */
    mutable std::mutex mutex_;

    /** @brief Condition variable signaled on state changes */
    std::condition_variable cond_;

    /** @brief Current state */
    State state_;

    /** @brief Error that stopped the task */
    std::optional<ErrorCode> error_;

    /** @brief Error description */
    std::string error_msg_;

    /** @brief Token of the current run */
    std::shared_ptr<CancellationToken> token_;

    /** @brief Control channel */
    SafeQueue<TaskMsg> ctl_q_;

    /** @brief Flag indicating the worker has exited */
    bool worker_done_;

    /** @brief Worker thread */
    std::thread worker_thread_;

    /** @brief Algorithm context. Only touched by the worker thread. */
    std::shared_ptr<AlgorithmContext> ctx_;

    /** @brief Start the worker thread if it is not running. Caller must hold mutex_. */
    void startWorker(void);

    /** @brief Worker loop */
    void worker(std::shared_ptr<ControlTask> self);

    /** @brief Execute the configure hook followed by the run hook */
    void configureAndRun(void);

    /** @brief Execute the run hook until it returns */
    void runAlgorithm(const std::shared_ptr<CancellationToken> &token);

    /** @brief Pause. Caller must hold mutex_. */
    bool pauseLocked(void);

    /** @brief Stop. Caller must hold mutex_. */
    void stopLocked(void);

    /** @brief Move to Stopped, recording an error. Caller must hold mutex_. */
    void failLocked(ErrorCode code, const std::string &msg);

};

/** @brief Return the name of a task state */
const char *controlTaskState2string(ControlTask::State state);

#endif /* RC_CONTROLTASK_HH_ */
