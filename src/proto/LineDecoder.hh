// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PROTO_LINEDECODER_HH_
#define PROTO_LINEDECODER_HH_

#include <string_view>

#include "proto/Cursor.hh"
#include "proto/Events.hh"
#include "proto/MrrDecoder.hh"

/** @brief Maximum length of a radio identifier */
constexpr size_t kMaxPhyLen = 16;

/** @brief Number of hex digits in a hex timestamp */
constexpr size_t kHexTimestampLen = 16;

/** @brief Maximum number of digits in the seconds part of a timestamp */
constexpr size_t kMaxSecLen = 20;

/** @brief Number of digits in the nanoseconds part of a timestamp */
constexpr size_t kNsecLen = 9;

/** @brief Field counts of each record type for hex timestamps */
constexpr size_t kTxsPairFields = 15;
constexpr size_t kTxsTupleFields = 11;
constexpr size_t kStatsFields = 11;
constexpr size_t kRxsFields = 9;
constexpr size_t kStaAddMinFields = 12;
constexpr size_t kStaRemoveMinFields = 5;
constexpr size_t kModeAckFields = 5;
constexpr size_t kApiVersionFields = 5;
constexpr size_t kErrorMinFields = 4;

/** @brief Decode protocol lines into events */
/** The decoder holds no state beyond the timestamp format of the connection it
 * serves, so one decoder may be shared by threads.
 */
class LineDecoder {
public:
    explicit LineDecoder(TimestampFormat fmt = TimestampFormat::kHex)
      : fmt_(fmt)
    {
    }

    /** @brief Get the timestamp format */
    TimestampFormat getTimestampFormat(void) const
    {
        return fmt_;
    }

    /** @brief Set the timestamp format */
    void setTimestampFormat(TimestampFormat fmt)
    {
        fmt_ = fmt;
    }

    /** @brief Decode one line.
     * A trailing newline is ignored.
     * @throw DecodeError if the line is malformed
     */
    Event decode(std::string_view line) const;

    /** @brief Decode one transmission status line.
     * @throw DecodeError if the line is malformed or not a txs line
     */
    TxStatusEvent decodeTxStatus(std::string_view line) const;

private:
    /** @brief Timestamp format */
    TimestampFormat fmt_;

    /** @brief Number of extra fields the timestamp occupies */
    size_t timestampExtraFields(void) const
    {
        return fmt_ == TimestampFormat::kSecNsec ? 1 : 0;
    }

    /** @brief Read the radio identifier */
    std::string_view decodePhy(FieldCursor &c) const;

    /** @brief Read the timestamp, normalized to nanoseconds */
    uint64_t decodeTimestamp(FieldCursor &c) const;

    /** @brief Check that the line has the expected number of fields */
    void expectFields(const FieldCursor &c,
                      std::string_view type,
                      size_t expected) const;

    /** @brief Check that the line has at least the expected number of fields */
    void expectMinFields(const FieldCursor &c,
                         std::string_view type,
                         size_t expected) const;

    Event decodeHeader(FieldCursor &c) const;

    TxStatusEvent decodeTxStatus(FieldCursor &c,
                                 std::string_view phy,
                                 uint64_t timestamp) const;

    RateStatsEvent decodeRateStats(FieldCursor &c,
                                   std::string_view phy,
                                   uint64_t timestamp) const;

    RxStatusEvent decodeRxStatus(FieldCursor &c,
                                 std::string_view phy,
                                 uint64_t timestamp) const;

    Event decodeStation(FieldCursor &c,
                        std::string_view phy,
                        uint64_t timestamp) const;

    ModeAckEvent decodeModeAck(FieldCursor &c,
                               std::string_view phy,
                               uint64_t timestamp) const;
};

/** @brief Strip trailing newline characters */
std::string_view chomp(std::string_view line);

#endif /* PROTO_LINEDECODER_HH_ */
