// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "Station.hh"
#include "logging.hh"
#include "rc/ControlTask.hh"

static std::string mkLabel(const std::weak_ptr<Station> &sta,
                           const std::shared_ptr<RateControlAlgorithm> &alg)
{
    std::shared_ptr<Station> s = sta.lock();
    std::string              label = s ? s->getMac().toString() : std::string("<detached>");

    return label + "/" + alg->getName();
}

ControlTask::ControlTask(std::weak_ptr<Station> sta,
                         std::shared_ptr<RateControlAlgorithm> alg,
                         const AlgorithmOptions &opts)
  : sta_(sta)
  , alg_(alg)
  , opts_(opts)
  , label_(mkLabel(sta, alg))
  , can_pause_(alg->canPause())
  , state_(kUnconfigured)
  , worker_done_(false)
{
}

ControlTask::~ControlTask()
{
    ctl_q_.close();

    if (worker_thread_.joinable()) {
        if (worker_thread_.get_id() == std::this_thread::get_id())
            worker_thread_.detach();
        else
            worker_thread_.join();
    }
}

bool ControlTask::start(void)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != kUnconfigured)
        return false;

    logRC(LOGDEBUG, "%s: configuring", label_.c_str());

    state_ = kConfiguring;
    startWorker();
    ctl_q_.push(TaskMsg{ TaskMsg::kConfigure, nullptr });
    cond_.notify_all();

    return true;
}

bool ControlTask::pause(void)
{
    std::lock_guard<std::mutex> lock(mutex_);

    return pauseLocked();
}

bool ControlTask::pauseLocked(void)
{
    if (state_ != kRunning)
        return false;

    logRC(LOGDEBUG, "%s: pausing", label_.c_str());

    state_ = kPaused;
    token_->cancel();
    ctl_q_.push(TaskMsg{ TaskMsg::kPause, nullptr });
    cond_.notify_all();

    return true;
}

bool ControlTask::resume(void)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != kPaused)
        return false;

    logRC(LOGDEBUG, "%s: resuming", label_.c_str());

    if (can_pause_) {
        state_ = kRunning;
        token_ = std::make_shared<CancellationToken>();
        ctl_q_.push(TaskMsg{ TaskMsg::kResume, token_ });
    } else {
        state_ = kConfiguring;
        ctl_q_.push(TaskMsg{ TaskMsg::kConfigure, nullptr });
    }

    cond_.notify_all();

    return true;
}

ControlTask::State ControlTask::suspend(void)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == kRunning)
        pauseLocked();
    else if (state_ == kConfiguring)
        stopLocked();

    return state_;
}

void ControlTask::stop(void)
{
    std::lock_guard<std::mutex> lock(mutex_);

    stopLocked();
}

void ControlTask::stopLocked(void)
{
    if (state_ == kStopped)
        return;

    logRC(LOGDEBUG, "%s: stopping", label_.c_str());

    state_ = kStopped;

    if (token_)
        token_->cancel();

    ctl_q_.push(TaskMsg{ TaskMsg::kStop, nullptr });
    ctl_q_.close();
    cond_.notify_all();
}

bool ControlTask::waitSettled(std::chrono::duration<double> timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);

    return cond_.wait_for(lock, timeout, [this]{ return state_ != kConfiguring; });
}

bool ControlTask::join(std::chrono::duration<double> timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (!worker_thread_.joinable())
        return true;

    if (worker_thread_.get_id() == std::this_thread::get_id())
        return false;

    if (!cond_.wait_for(lock, timeout, [this]{ return worker_done_; })) {
        logRC(LOGWARNING, "%s: algorithm did not honor cancellation", label_.c_str());
        worker_thread_.detach();
        return false;
    }

    std::thread t = std::move(worker_thread_);

    lock.unlock();
    t.join();

    return true;
}

void ControlTask::startWorker(void)
{
    if (!worker_thread_.joinable() && !worker_done_)
        worker_thread_ = std::thread(&ControlTask::worker, this, shared_from_this());
}

void ControlTask::worker(std::shared_ptr<ControlTask> self)
{
    TaskMsg msg;

    while (ctl_q_.pop(msg)) {
        if (getState() == kStopped || msg.kind == TaskMsg::kStop)
            break;

        switch (msg.kind) {
            case TaskMsg::kConfigure:
                configureAndRun();
                break;

            case TaskMsg::kPause:
                if (can_pause_ && ctx_) {
                    try {
                        alg_->pause(ctx_);
                    } catch (const std::exception &e) {
                        logRC(LOGERROR, "%s: pause failed: %s", label_.c_str(), e.what());
                    }
                }
                break;

            case TaskMsg::kResume:
                if (ctx_ && !msg.token->isCancelled()) {
                    try {
                        alg_->resume(ctx_);
                    } catch (const std::exception &e) {
                        std::lock_guard<std::mutex> lock(mutex_);

                        if (state_ == kRunning && token_ == msg.token)
                            failLocked(ErrorCode::kAlgorithmConfigureFailed,
                                       std::string("resume failed: ") + e.what());
                        break;
                    }

                    runAlgorithm(msg.token);
                }
                break;

            case TaskMsg::kStop:
                break;
        }
    }

    ctx_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);

        worker_done_ = true;
    }

    cond_.notify_all();

    logRC(LOGDEBUG, "%s: worker exited", label_.c_str());
}

void ControlTask::configureAndRun(void)
{
    std::shared_ptr<Station> sta = sta_.lock();

    if (!sta) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == kConfiguring)
            failLocked(ErrorCode::kAlgorithmConfigureFailed, "station no longer exists");
        return;
    }

    std::shared_ptr<AlgorithmContext> ctx;

    try {
        ctx = alg_->configure(sta, opts_);
    } catch (const std::exception &e) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == kConfiguring)
            failLocked(ErrorCode::kAlgorithmConfigureFailed, e.what());
        return;
    }

    sta.reset();

    std::shared_ptr<CancellationToken> token;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != kConfiguring)
            return;

        ctx_ = ctx;
        state_ = kRunning;
        token_ = token = std::make_shared<CancellationToken>();
        cond_.notify_all();
    }

    logRC(LOGINFO, "%s: running", label_.c_str());

    runAlgorithm(token);
}

void ControlTask::runAlgorithm(const std::shared_ptr<CancellationToken> &token)
{
    std::string error;

    try {
        alg_->run(ctx_, *token);
    } catch (const std::exception &e) {
        error = e.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == kRunning && token_ == token && !token->isCancelled()) {
        if (error.empty())
            failLocked(ErrorCode::kAlgorithmRunExited, "run returned");
        else
            failLocked(ErrorCode::kAlgorithmRunExited, "run failed: " + error);
    } else if (!error.empty())
        logRC(LOGWARNING, "%s: run failed after cancellation: %s", label_.c_str(), error.c_str());
}

void ControlTask::failLocked(ErrorCode code, const std::string &msg)
{
    logRC(LOGERROR, "%s: %s: %s", label_.c_str(), errorCode2string(code), msg.c_str());

    state_ = kStopped;
    error_ = code;
    error_msg_ = msg;

    if (token_)
        token_->cancel();

    ctl_q_.close();
    cond_.notify_all();
}

const char *controlTaskState2string(ControlTask::State state)
{
    switch (state) {
        case ControlTask::kUnconfigured:
            return "unconfigured";

        case ControlTask::kConfiguring:
            return "configuring";

        case ControlTask::kRunning:
            return "running";

        case ControlTask::kPaused:
            return "paused";

        case ControlTask::kStopped:
            return "stopped";
    }

    return "unknown";
}
