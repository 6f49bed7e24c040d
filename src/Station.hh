// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef STATION_HH_
#define STATION_HH_

#include <stdint.h>

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AccessPoint.hh"
#include "proto/Events.hh"
#include "rc/ControlTask.hh"
#include "rc/RateControlAlgorithm.hh"
#include "stats/RateStatsTable.hh"
#include "util/net.hh"

/** @brief A client station associated with an access point */
/** A station owns its rate statistics and, once an algorithm has been
 * attached, the control task running that algorithm. Events are applied by
 * the dispatcher. Commands are issued by the station's algorithm and are sent
 * through the access point in the order they are issued.
 */
class Station : public std::enable_shared_from_this<Station> {
public:
    Station(std::shared_ptr<AccessPoint> ap,
            const std::string &phy,
            const MacAddr &mac);

    ~Station();

    Station() = delete;
    Station(const Station&) = delete;
    Station(Station&&) = delete;

    Station& operator=(const Station&) = delete;
    Station& operator=(Station&&) = delete;

    /** @brief Get the access point the station is associated with */
    const std::shared_ptr<AccessPoint> &getAccessPoint(void) const
    {
        return ap_;
    }

    /** @brief Get the radio the station is associated with */
    const std::string &getPhy(void) const
    {
        return phy_;
    }

    /** @brief Get the station's address */
    const MacAddr &getMac(void) const
    {
        return mac_;
    }

    /** @brief Get the network interface the station is associated with */
    std::string getInterface(void) const;

    /** @brief Get rate control mode */
    ControlMode getRcMode(void) const;

    /** @brief Get power control mode */
    ControlMode getTpcMode(void) const;

    /** @brief Is the station associated? */
    bool isAssociated(void) const;

    /** @brief Should the control task pause rather than stop on disassociation? */
    bool getPauseOnDisassoc(void) const;

    /** @brief Set whether the control task pauses on disassociation */
    void setPauseOnDisassoc(bool pause);

    /** @brief Timestamp of the most recent event [ns] */
    uint64_t getLastSeen(void) const;

    /** @brief Get the rates the station supports */
    std::vector<int> getSupportedRates(void) const;

    /** @brief Get the kernel algorithm's update and sample frequencies */
    std::pair<unsigned, unsigned> getKernelFrequencies(void) const;

    /** @brief Get the MCS and legacy overheads */
    std::pair<unsigned, unsigned> getOverheads(void) const;

    /** @brief Get the most recent minimum RSSI [dBm] */
    std::optional<int32_t> getRssi(void) const;

    /** @brief Get the most recent per-antenna RSSI [dBm] */
    std::array<std::optional<int32_t>, kMaxAntennas> getRssiVals(void) const;

    /** @brief Get rate statistics */
    RateStatsTable &getRateStats(void)
    {
        return stats_;
    }

    /** @brief Get rate statistics */
    const RateStatsTable &getRateStats(void) const
    {
        return stats_;
    }

    /** @brief Get the control task, if an algorithm is attached */
    std::shared_ptr<ControlTask> getControlTask(void) const;

    /** @brief Switch between manual and automatic rate control.
     * No command is sent if the mode is unchanged.
     * @throw StationModeError if manual mode is requested while disassociated
     */
    void setManualRcMode(bool enable);

    /** @brief Switch between manual and automatic power control.
     * No command is sent if the mode is unchanged.
     * @throw StationModeError if manual mode is requested while disassociated
     */
    void setManualTpcMode(bool enable);

    /** @brief Install a rate table.
     * @throw StationModeError if not in manual rate control mode
     * @throw std::invalid_argument if the tables are malformed
     */
    void setRates(const std::vector<int> &rates,
                  const std::vector<unsigned> &counts);

    /** @brief Install a power table.
     * @throw StationModeError if not in manual power control mode
     */
    void setPower(const std::vector<int> &txpowers);

    /** @brief Install a rate and power table.
     * @throw StationModeError if not in manual rate and power control mode
     */
    void setRatesAndPower(const std::vector<int> &rates,
                          const std::vector<unsigned> &counts,
                          const std::vector<int> &txpowers);

    /** @brief Probe a rate.
     * @throw StationModeError if not in manual rate control mode
     */
    void setProbeRate(int rate, std::optional<int> txpower = std::nullopt);

    /** @brief Reset the kernel's statistics for this station */
    void resetKernelRateStats(void);

    /** @brief Reset our statistics for this station */
    void resetRateStats(void);

    /** @brief Attach a rate control algorithm.
     * Any other attached algorithm is stopped first. Attaching the algorithm
     * that is already running with the same options does nothing. If the
     * station is associated, this waits for the algorithm to configure.
     * @throw RateControlError if the algorithm's configure hook fails
     */
    void startRateControl(std::shared_ptr<RateControlAlgorithm> alg,
                          const AlgorithmOptions &opts = {});

    /** @brief Stop and detach the rate control algorithm. Idempotent. */
    void stopRateControl(void);

    /** @brief Pause the rate control algorithm.
     * @return true if the algorithm was running
     */
    bool pauseRateControl(void);

    /** @brief Resume the rate control algorithm.
     * @return true if the algorithm was paused
     */
    bool resumeRateControl(void);

    /** @brief Apply an association record */
    void onAssociated(const StationAddEvent &ev);

    /** @brief Apply a disassociation */
    void onDisassociated(uint64_t timestamp);

    /** @brief Apply a transmission status report.
     * @return false if the report was stale and dropped
     */
    bool applyTxStatus(const TxStatusEvent &ev);

    /** @brief Apply a signal strength report.
     * @return false if the report was stale and dropped
     */
    bool applyRxStatus(const RxStatusEvent &ev);

    /** @brief Apply a mode acknowledgement */
    void applyModeAck(const ModeAckEvent &ev);

private:
    /** @brief The access point */
    const std::shared_ptr<AccessPoint> ap_;

    /** @brief Radio */
    const std::string phy_;

    /** @brief Address */
    const MacAddr mac_;

    /** @brief Mutex protecting station state */
    mutable std::mutex mutex_;

    /** @brief Mutex serializing station commands */
    std::mutex cmd_mutex_;

    /** @brief Network interface */
    std::string iface_;

    ControlMode rc_mode_;

    ControlMode tpc_mode_;

    bool associated_;

    bool pause_on_disassoc_;

    uint64_t last_seen_;

    std::vector<int> supported_rates_;

    unsigned overhead_mcs_;

    unsigned overhead_legacy_;

    unsigned update_freq_;

    unsigned sample_freq_;

    std::optional<int32_t> rssi_;

    std::array<std::optional<int32_t>, kMaxAntennas> rssi_vals_;

    /** @brief Rate statistics */
    RateStatsTable stats_;

    /** @brief Control task */
    std::shared_ptr<ControlTask> task_;

    /** @brief Check whether an event is stale, updating last seen time.
     * Caller must hold mutex_.
     */
    bool checkStaleLocked(uint64_t timestamp);

    /** @brief Send a command that requires manual modes */
    void sendManual(const std::string &line,
                    bool need_rc,
                    bool need_tpc,
                    const char *what);
};

#endif /* STATION_HH_ */
