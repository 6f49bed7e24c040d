// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PROTO_EVENTS_HH_
#define PROTO_EVENTS_HH_

#include <stdint.h>

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "util/net.hh"

/** @brief Wire encoding of timestamps */
enum class TimestampFormat {
    /** @brief One 16-digit hexadecimal field of nanoseconds */
    kHex = 0,
    /** @brief Two decimal fields, seconds and nanoseconds */
    kSecNsec
};

/** @brief Who controls rate or power selection */
enum class ControlMode {
    /** @brief The device's own algorithm */
    kAuto = 0,
    /** @brief This controller */
    kManual
};

/** @brief Return the wire name of a control mode */
const char *controlMode2string(ControlMode mode);

/** @brief Parse a control mode.
 * Accepts manual, auto, 1, and 0.
 * @return The mode, or std::nullopt if s is not a mode
 */
std::optional<ControlMode> string2ControlMode(const std::string &s);

/** @brief Number of rate indices reserved for each rate group */
constexpr unsigned kRatesPerGroup = 16;

/** @brief Maximum number of multi-rate retry stages */
constexpr unsigned kMaxMrrStages = 4;

/** @brief Rate of an absent stage */
constexpr int kAbsentRate = -1;

/** @brief TX power of a stage that carries none */
constexpr int kAbsentTxPower = -1;

/** @brief A multi-rate retry stage */
struct MrrStage {
    /** @brief Rate index, or kAbsentRate */
    int rate = kAbsentRate;

    /** @brief Retry count */
    unsigned count = 0;

    /** @brief TX power index, or kAbsentTxPower */
    int txpower = kAbsentTxPower;

    /** @brief Attempts derived from frame count times retry count */
    uint64_t attempts = 0;

    /** @brief Successes, non-zero only for the credited stage */
    uint64_t successes = 0;

    /** @brief Return true if this stage was attempted */
    bool isPresent(void) const
    {
        return rate != kAbsentRate;
    }
};

/** @brief The full retry chain of a transmission */
struct MrrChain {
    std::array<MrrStage, kMaxMrrStages> stages;

    /** @brief Number of populated stages */
    unsigned npresent = 0;

    /** @brief Index of the stage credited with the acknowledged frames */
    std::optional<unsigned> credited;
};

/** @brief Transmission status report */
struct TxStatusEvent {
    std::string phy;

    /** @brief Timestamp [ns] */
    uint64_t timestamp = 0;

    MacAddr mac;

    /** @brief Number of frames sent */
    unsigned num_frames = 0;

    /** @brief Number of frames acknowledged */
    unsigned num_acked = 0;

    /** @brief Was this a probe transmission? */
    bool probe = false;

    MrrChain mrr;
};

/** @brief Kernel rate statistics report */
/** Reported for telemetry only. */
struct RateStatsEvent {
    std::string phy;

    /** @brief Timestamp [ns] */
    uint64_t timestamp = 0;

    MacAddr mac;

    int rate = 0;

    /** @brief Exponentially averaged success probability */
    uint32_t avg_prob = 0;

    /** @brief Exponentially averaged throughput */
    uint32_t avg_tp = 0;

    uint32_t cur_success = 0;

    uint32_t cur_attempts = 0;

    uint64_t hist_success = 0;

    uint64_t hist_attempts = 0;
};

/** @brief Number of antennas reported in a signal strength record */
constexpr unsigned kMaxAntennas = 4;

/** @brief Receive signal strength report */
struct RxStatusEvent {
    std::string phy;

    /** @brief Timestamp [ns] */
    uint64_t timestamp = 0;

    MacAddr mac;

    /** @brief Minimum RSSI over all antennas [dBm] */
    int32_t min_rssi = 0;

    /** @brief Per-antenna RSSI [dBm] */
    std::array<std::optional<int32_t>, kMaxAntennas> rssi;
};

/** @brief Station association record */
struct StationAddEvent {
    enum Kind {
        kAdd = 0,
        kDump,
        kUpdate
    };

    std::string phy;

    /** @brief Timestamp [ns] */
    uint64_t timestamp = 0;

    Kind kind = kAdd;

    MacAddr mac;

    /** @brief Network interface the station is associated with */
    std::string iface;

    ControlMode rc_mode = ControlMode::kAuto;

    ControlMode tpc_mode = ControlMode::kAuto;

    unsigned overhead_mcs = 0;

    unsigned overhead_legacy = 0;

    unsigned update_freq = 0;

    unsigned sample_freq = 0;

    /** @brief Supported rate bitmask of each rate group */
    std::vector<uint16_t> group_masks;

    /** @brief Return the supported rate indices */
    /** Rate index is group*16 + offset for each set bit offset of a group's
     * mask.
     */
    std::vector<int> supportedRates(void) const;
};

/** @brief Station disassociation record */
struct StationRemoveEvent {
    std::string phy;

    /** @brief Timestamp [ns] */
    uint64_t timestamp = 0;

    MacAddr mac;
};

/** @brief Mode acknowledgement from the device */
struct ModeAckEvent {
    enum Kind {
        kRate = 0,
        kPower
    };

    std::string phy;

    /** @brief Timestamp [ns] */
    uint64_t timestamp = 0;

    Kind kind = kRate;

    MacAddr mac;

    ControlMode mode = ControlMode::kAuto;
};

/** @brief Error reported by the device */
struct DeviceErrorEvent {
    std::string message;
};

/** @brief Supported API major version */
constexpr unsigned kApiVersionMajor = 2;

/** @brief Supported API minor version */
constexpr unsigned kApiVersionMinor = 9;

/** @brief API version announced by the device */
struct ApiVersionEvent {
    unsigned major = 0;

    unsigned minor = 0;

    bool isSupported(void) const
    {
        return major == kApiVersionMajor && minor == kApiVersionMinor;
    }
};

/** @brief A decoded protocol record */
using Event = std::variant<TxStatusEvent,
                           RateStatsEvent,
                           RxStatusEvent,
                           StationAddEvent,
                           StationRemoveEvent,
                           ModeAckEvent,
                           DeviceErrorEvent,
                           ApiVersionEvent>;

/** @brief Return the record name of an event */
const char *eventName(const Event &ev);

#endif /* PROTO_EVENTS_HH_ */
