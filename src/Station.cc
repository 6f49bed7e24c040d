// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "ControllerConfig.hh"
#include "Errors.hh"
#include "Station.hh"
#include "logging.hh"
#include "proto/Command.hh"

Station::Station(std::shared_ptr<AccessPoint> ap,
                 const std::string &phy,
                 const MacAddr &mac)
  : ap_(ap)
  , phy_(phy)
  , mac_(mac)
  , rc_mode_(ControlMode::kAuto)
  , tpc_mode_(ControlMode::kAuto)
  , associated_(false)
  , pause_on_disassoc_(cfg.pause_on_disassoc)
  , last_seen_(0)
  , overhead_mcs_(0)
  , overhead_legacy_(0)
  , update_freq_(0)
  , sample_freq_(0)
  , stats_(ap->getRadio(phy).num_rates, ap->getRadio(phy).num_txpowers)
{
}

Station::~Station()
{
    if (task_)
        task_->stop();
}

std::string Station::getInterface(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return iface_;
}

ControlMode Station::getRcMode(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return rc_mode_;
}

ControlMode Station::getTpcMode(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return tpc_mode_;
}

bool Station::isAssociated(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return associated_;
}

bool Station::getPauseOnDisassoc(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return pause_on_disassoc_;
}

void Station::setPauseOnDisassoc(bool pause)
{
    std::lock_guard<std::mutex> lock(mutex_);

    pause_on_disassoc_ = pause;
}

uint64_t Station::getLastSeen(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return last_seen_;
}

std::vector<int> Station::getSupportedRates(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return supported_rates_;
}

std::pair<unsigned, unsigned> Station::getKernelFrequencies(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return std::make_pair(update_freq_, sample_freq_);
}

std::pair<unsigned, unsigned> Station::getOverheads(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return std::make_pair(overhead_mcs_, overhead_legacy_);
}

std::optional<int32_t> Station::getRssi(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return rssi_;
}

std::array<std::optional<int32_t>, kMaxAntennas> Station::getRssiVals(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return rssi_vals_;
}

std::shared_ptr<ControlTask> Station::getControlTask(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    return task_;
}

void Station::setManualRcMode(bool enable)
{
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);
    ControlMode                 mode = enable ? ControlMode::kManual : ControlMode::kAuto;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (rc_mode_ == mode)
            return;

        if (enable && !associated_)
            throw StationModeError("Cannot enable manual rate control for disassociated station " + mac_.toString());
    }

    ap_->send(cmd::rcMode(phy_, mode));

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // The station may have disassociated while the command was in flight
        if (enable && !associated_) {
            logStation(LOGDEBUG, "%s: disassociated before manual rate control took effect",
                mac_.toString().c_str());
            return;
        }

        rc_mode_ = mode;
    }

    logStation(LOGDEBUG, "%s: rc_mode=%s", mac_.toString().c_str(), controlMode2string(mode));
}

void Station::setManualTpcMode(bool enable)
{
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);
    ControlMode                 mode = enable ? ControlMode::kManual : ControlMode::kAuto;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (tpc_mode_ == mode)
            return;

        if (enable && !associated_)
            throw StationModeError("Cannot enable manual power control for disassociated station " + mac_.toString());
    }

    ap_->send(cmd::tpcMode(phy_, mode));

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // The station may have disassociated while the command was in flight
        if (enable && !associated_) {
            logStation(LOGDEBUG, "%s: disassociated before manual power control took effect",
                mac_.toString().c_str());
            return;
        }

        tpc_mode_ = mode;
    }

    logStation(LOGDEBUG, "%s: tpc_mode=%s", mac_.toString().c_str(), controlMode2string(mode));
}

void Station::sendManual(const std::string &line,
                         bool need_rc,
                         bool need_tpc,
                         const char *what)
{
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (need_rc && rc_mode_ != ControlMode::kManual)
            throw StationModeError(std::string("Need to be in manual rate control mode to ") + what);

        if (need_tpc && tpc_mode_ != ControlMode::kManual)
            throw StationModeError(std::string("Need to be in manual power control mode to ") + what);
    }

    ap_->send(line);
}

void Station::setRates(const std::vector<int> &rates,
                       const std::vector<unsigned> &counts)
{
    sendManual(cmd::setRates(phy_, mac_, rates, counts), true, false, "set rates");
}

void Station::setPower(const std::vector<int> &txpowers)
{
    sendManual(cmd::setPower(phy_, mac_, txpowers), false, true, "set power");
}

void Station::setRatesAndPower(const std::vector<int> &rates,
                               const std::vector<unsigned> &counts,
                               const std::vector<int> &txpowers)
{
    sendManual(cmd::setRatesPower(phy_, mac_, rates, counts, txpowers), true, true, "set rates and power");
}

void Station::setProbeRate(int rate, std::optional<int> txpower)
{
    sendManual(cmd::probe(phy_, mac_, rate, txpower), true, txpower.has_value(), "probe");
}

void Station::resetKernelRateStats(void)
{
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);

    ap_->send(cmd::resetStats(phy_, mac_));
}

void Station::resetRateStats(void)
{
    stats_.clear();
}

void Station::startRateControl(std::shared_ptr<RateControlAlgorithm> alg,
                               const AlgorithmOptions &opts)
{
    std::shared_ptr<ControlTask> old = getControlTask();

    if (old &&
        old->getAlgorithm()->getName() == alg->getName() &&
        old->getOptions() == opts &&
        old->getState() != ControlTask::kStopped)
        return;

    if (old)
        stopRateControl();

    auto task = std::make_shared<ControlTask>(weak_from_this(), alg, opts);
    bool associated;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        task_ = task;
        associated = associated_;
    }

    logStation(LOGINFO, "%s: start rate control algorithm %s",
        mac_.toString().c_str(),
        alg->getName().c_str());

    if (!associated)
        return;

    task->start();

    if (!task->waitSettled(cfg.configure_timeout)) {
        logStation(LOGWARNING, "%s: rate control algorithm %s still configuring",
            mac_.toString().c_str(),
            alg->getName().c_str());
        return;
    }

    if (task->getError() == ErrorCode::kAlgorithmConfigureFailed)
        throw RateControlError(ErrorCode::kAlgorithmConfigureFailed,
                               alg->getName() + ": " + task->getErrorMessage());
}

void Station::stopRateControl(void)
{
    std::shared_ptr<ControlTask> task;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        task.swap(task_);
    }

    if (task) {
        logStation(LOGINFO, "%s: stop rate control algorithm %s",
            mac_.toString().c_str(),
            task->getAlgorithm()->getName().c_str());

        task->stop();
        task->join(cfg.cancel_timeout);
    }
}

bool Station::pauseRateControl(void)
{
    std::shared_ptr<ControlTask> task = getControlTask();

    return task && task->pause();
}

bool Station::resumeRateControl(void)
{
    std::shared_ptr<ControlTask> task = getControlTask();

    return task && task->resume();
}

void Station::onAssociated(const StationAddEvent &ev)
{
    std::shared_ptr<ControlTask> task;
    unsigned                     n_rates = 0;
    bool                         was_associated;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        was_associated = associated_;

        associated_ = true;
        iface_ = ev.iface;
        rc_mode_ = ev.rc_mode;
        tpc_mode_ = ev.tpc_mode;
        overhead_mcs_ = ev.overhead_mcs;
        overhead_legacy_ = ev.overhead_legacy;
        update_freq_ = ev.update_freq;
        sample_freq_ = ev.sample_freq;

        if (!ev.group_masks.empty()) {
            supported_rates_ = ev.supportedRates();
            n_rates = kRatesPerGroup*ev.group_masks.size();
        }

        if (ev.timestamp > last_seen_)
            last_seen_ = ev.timestamp;

        task = task_;
    }

    if (n_rates > stats_.getNumRates())
        stats_.reset(n_rates, stats_.getNumTxPowers());

    if (was_associated && ev.kind == StationAddEvent::kUpdate)
        return;

    logStation(LOGINFO, "%s: associated with %s on %s",
        mac_.toString().c_str(),
        phy_.c_str(),
        ev.iface.c_str());

    if (task) {
        switch (task->getState()) {
            case ControlTask::kUnconfigured:
                task->start();
                break;

            case ControlTask::kPaused:
                task->resume();
                break;

            default:
                break;
        }
    }
}

void Station::onDisassociated(uint64_t timestamp)
{
    std::shared_ptr<ControlTask> task;
    bool                         pause_on_disassoc;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        associated_ = false;

        // Manual control cannot be asserted on a station that is not present
        rc_mode_ = ControlMode::kAuto;
        tpc_mode_ = ControlMode::kAuto;

        if (timestamp > last_seen_)
            last_seen_ = timestamp;

        task = task_;
        pause_on_disassoc = pause_on_disassoc_;
    }

    logStation(LOGINFO, "%s: disassociated from %s",
        mac_.toString().c_str(),
        phy_.c_str());

    if (!task)
        return;

    if (pause_on_disassoc) {
        ControlTask::State state = task->suspend();

        logStation(LOGDEBUG, "%s: rate control %s on disassociation",
            mac_.toString().c_str(),
            controlTaskState2string(state));
    } else
        task->stop();
}

bool Station::checkStaleLocked(uint64_t timestamp)
{
    if (cfg.drop_stale_events && timestamp < last_seen_)
        return true;

    if (timestamp > last_seen_)
        last_seen_ = timestamp;

    return false;
}

bool Station::applyTxStatus(const TxStatusEvent &ev)
{
    bool tpc_auto;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (checkStaleLocked(ev.timestamp))
            return false;

        tpc_auto = tpc_mode_ == ControlMode::kAuto;
    }

    stats_.update(ev.timestamp, ev.mrr, tpc_auto);

    return true;
}

bool Station::applyRxStatus(const RxStatusEvent &ev)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (checkStaleLocked(ev.timestamp))
        return false;

    rssi_ = ev.min_rssi;
    rssi_vals_ = ev.rssi;

    return true;
}

void Station::applyModeAck(const ModeAckEvent &ev)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // A late acknowledgement cannot put a disassociated station in manual mode
    if (ev.mode == ControlMode::kManual && !associated_)
        return;

    if (ev.kind == ModeAckEvent::kRate)
        rc_mode_ = ev.mode;
    else
        tpc_mode_ = ev.mode;
}
