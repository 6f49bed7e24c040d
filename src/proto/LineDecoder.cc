// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <limits>

#include "Clock.hh"
#include "proto/LineDecoder.hh"
#include "util/ssprintf.hh"

/** @brief Radio identifier of header lines */
constexpr std::string_view kHeaderPhy = "*";

std::string_view chomp(std::string_view line)
{
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.remove_suffix(1);

    return line;
}

static bool parseProbe(std::string_view s)
{
    if (s == "1")
        return true;
    else if (s == "0")
        return false;
    else
        throw DecodeError(ErrorCode::kMalformedField,
                          "Illegal probe flag: " + std::string(s));
}

static ControlMode parseMode(std::string_view s)
{
    std::optional<ControlMode> mode = string2ControlMode(std::string(s));

    if (!mode)
        throw DecodeError(ErrorCode::kMalformedField,
                          "Illegal control mode: " + std::string(s));

    return *mode;
}

Event LineDecoder::decode(std::string_view line) const
{
    FieldCursor c(chomp(line));

    if (c.peek() == kHeaderPhy)
        return decodeHeader(c);

    std::string_view phy = decodePhy(c);
    uint64_t         timestamp = decodeTimestamp(c);
    std::string_view type = c.peek();

    if (type == "txs")
        return decodeTxStatus(c, phy, timestamp);
    else if (type == "stats" || type == "rcs")
        return decodeRateStats(c, phy, timestamp);
    else if (type == "rxs")
        return decodeRxStatus(c, phy, timestamp);
    else if (type == "sta")
        return decodeStation(c, phy, timestamp);
    else if (type == "rc_mode" || type == "tpc_mode")
        return decodeModeAck(c, phy, timestamp);
    else
        throw DecodeError(ErrorCode::kUnexpectedRecordType,
                          "Unexpected record type: " + std::string(type));
}

TxStatusEvent LineDecoder::decodeTxStatus(std::string_view line) const
{
    FieldCursor c(chomp(line));

    if (c.peek() == kHeaderPhy)
        throw DecodeError(ErrorCode::kUnexpectedRecordType,
                          "Expected txs record but got header");

    std::string_view phy = decodePhy(c);
    uint64_t         timestamp = decodeTimestamp(c);

    return decodeTxStatus(c, phy, timestamp);
}

std::string_view LineDecoder::decodePhy(FieldCursor &c) const
{
    std::string_view phy = c.next();

    if (phy.empty() || phy.size() > kMaxPhyLen)
        throw DecodeError(ErrorCode::kMalformedField,
                          "Illegal radio identifier: " + std::string(phy));

    return phy;
}

uint64_t LineDecoder::decodeTimestamp(FieldCursor &c) const
{
    if (fmt_ == TimestampFormat::kHex) {
        std::string_view ts = c.next();

        if (ts.size() != kHexTimestampLen)
            throw DecodeError(ErrorCode::kMalformedTimestamp,
                              "Illegal timestamp width: " + std::string(ts));

        return parseUnsigned<uint64_t>(ts, "timestamp", 16, ErrorCode::kMalformedTimestamp);
    } else {
        std::string_view sec_field = c.next();
        std::string_view nsec_field = c.next();

        if (sec_field.empty() || sec_field.size() > kMaxSecLen || nsec_field.size() != kNsecLen)
            throw DecodeError(ErrorCode::kMalformedTimestamp,
                              "Illegal timestamp width: " + std::string(sec_field) + ";" + std::string(nsec_field));

        uint64_t sec = parseUnsigned<uint64_t>(sec_field, "timestamp seconds", 10, ErrorCode::kMalformedTimestamp);
        uint64_t nsec = parseUnsigned<uint64_t>(nsec_field, "timestamp nanoseconds", 10, ErrorCode::kMalformedTimestamp);

        if (sec > (std::numeric_limits<uint64_t>::max() - nsec) / kNanosecondsPerSecond)
            throw DecodeError(ErrorCode::kMalformedTimestamp,
                              "Timestamp out of range: " + std::string(sec_field));

        return sec*kNanosecondsPerSecond + nsec;
    }
}

void LineDecoder::expectFields(const FieldCursor &c,
                               std::string_view type,
                               size_t expected) const
{
    expected += timestampExtraFields();

    if (c.nfields() != expected)
        throw DecodeError(ErrorCode::kFieldCountMismatch,
                          ssprintf("Expected %lu fields in %.*s record but got %lu",
                                   (unsigned long) expected,
                                   static_cast<int>(type.size()), type.data(),
                                   (unsigned long) c.nfields()));
}

void LineDecoder::expectMinFields(const FieldCursor &c,
                                  std::string_view type,
                                  size_t expected) const
{
    expected += timestampExtraFields();

    if (c.nfields() < expected)
        throw DecodeError(ErrorCode::kFieldCountMismatch,
                          ssprintf("Expected at least %lu fields in %.*s record but got %lu",
                                   (unsigned long) expected,
                                   static_cast<int>(type.size()), type.data(),
                                   (unsigned long) c.nfields()));
}

Event LineDecoder::decodeHeader(FieldCursor &c) const
{
    // Header lines carry a literal 0 timestamp regardless of format
    c.next();
    c.next();

    std::string_view type = c.next();

    if (type == "orca_version") {
        if (c.nfields() != kApiVersionFields)
            throw DecodeError(ErrorCode::kFieldCountMismatch,
                              "Illegal orca_version record");

        ApiVersionEvent ev;

        ev.major = parseHex<uint16_t>(c.next(), "API major version");
        ev.minor = parseHex<uint16_t>(c.next(), "API minor version");

        return ev;
    } else if (type == "#error") {
        if (c.nfields() < kErrorMinFields)
            throw DecodeError(ErrorCode::kFieldCountMismatch,
                              "Illegal #error record");

        return DeviceErrorEvent{ std::string(c.rest()) };
    } else
        throw DecodeError(ErrorCode::kUnexpectedRecordType,
                          "Unexpected header record type: " + std::string(type));
}

TxStatusEvent LineDecoder::decodeTxStatus(FieldCursor &c,
                                          std::string_view phy,
                                          uint64_t timestamp) const
{
    std::string_view type = c.next();

    if (type != "txs")
        throw DecodeError(ErrorCode::kUnexpectedRecordType,
                          "Expected txs record but got " + std::string(type));

    MrrLayout layout;
    size_t    n = c.nfields() - timestampExtraFields();

    if (n == kTxsPairFields)
        layout = MrrLayout::kPair;
    else if (n == kTxsTupleFields)
        layout = MrrLayout::kTuple;
    else
        throw DecodeError(ErrorCode::kFieldCountMismatch,
                          ssprintf("Illegal number of fields in txs record: %lu",
                                   (unsigned long) c.nfields()));

    TxStatusEvent ev;

    ev.phy = std::string(phy);
    ev.timestamp = timestamp;
    ev.mac = parseMAC(c.next());
    ev.num_frames = parseHex<uint16_t>(c.next(), "frame count");
    ev.num_acked = parseHex<uint16_t>(c.next(), "acknowledged count");
    ev.probe = parseProbe(c.next());
    ev.mrr = decodeMrrChain(c, layout, ev.num_frames, ev.num_acked);

    return ev;
}

RateStatsEvent LineDecoder::decodeRateStats(FieldCursor &c,
                                            std::string_view phy,
                                            uint64_t timestamp) const
{
    std::string_view type = c.next();

    expectFields(c, type, kStatsFields);

    RateStatsEvent ev;

    ev.phy = std::string(phy);
    ev.timestamp = timestamp;
    ev.mac = parseMAC(c.next());
    ev.rate = parseHex<uint16_t>(c.next(), "rate");
    ev.avg_prob = parseHex<uint32_t>(c.next(), "average probability");
    ev.avg_tp = parseHex<uint32_t>(c.next(), "average throughput");
    ev.cur_success = parseHex<uint32_t>(c.next(), "current successes");
    ev.cur_attempts = parseHex<uint32_t>(c.next(), "current attempts");
    ev.hist_success = parseHex<uint64_t>(c.next(), "historical successes");
    ev.hist_attempts = parseHex<uint64_t>(c.next(), "historical attempts");

    return ev;
}

RxStatusEvent LineDecoder::decodeRxStatus(FieldCursor &c,
                                          std::string_view phy,
                                          uint64_t timestamp) const
{
    std::string_view type = c.next();

    expectFields(c, type, kRxsFields);

    RxStatusEvent ev;

    ev.phy = std::string(phy);
    ev.timestamp = timestamp;
    ev.mac = parseMAC(c.next());
    ev.min_rssi = parseS32(c.next(), "minimum RSSI");

    for (unsigned i = 0; i < kMaxAntennas; ++i) {
        std::string_view rssi = c.next();

        if (!rssi.empty())
            ev.rssi[i] = parseS32(rssi, "RSSI");
    }

    return ev;
}

Event LineDecoder::decodeStation(FieldCursor &c,
                                 std::string_view phy,
                                 uint64_t timestamp) const
{
    c.next();

    std::string_view sub = c.next();

    if (sub == "remove") {
        expectMinFields(c, sub, kStaRemoveMinFields);

        StationRemoveEvent ev;

        ev.phy = std::string(phy);
        ev.timestamp = timestamp;
        ev.mac = parseMAC(c.next());

        return ev;
    }

    StationAddEvent ev;

    if (sub == "add")
        ev.kind = StationAddEvent::kAdd;
    else if (sub == "dump")
        ev.kind = StationAddEvent::kDump;
    else if (sub == "update")
        ev.kind = StationAddEvent::kUpdate;
    else
        throw DecodeError(ErrorCode::kUnexpectedRecordType,
                          "Unexpected station record type: " + std::string(sub));

    expectMinFields(c, sub, kStaAddMinFields);

    ev.phy = std::string(phy);
    ev.timestamp = timestamp;
    ev.mac = parseMAC(c.next());
    ev.iface = std::string(c.next());
    ev.rc_mode = parseMode(c.next());
    ev.tpc_mode = parseMode(c.next());
    ev.overhead_mcs = parseHex<uint32_t>(c.next(), "MCS overhead");
    ev.overhead_legacy = parseHex<uint32_t>(c.next(), "legacy overhead");
    ev.update_freq = parseHex<uint32_t>(c.next(), "update frequency");
    ev.sample_freq = parseHex<uint32_t>(c.next(), "sample frequency");

    while (!c.atEnd())
        ev.group_masks.push_back(parseHex<uint16_t>(c.next(), "rate group mask"));

    return ev;
}

ModeAckEvent LineDecoder::decodeModeAck(FieldCursor &c,
                                        std::string_view phy,
                                        uint64_t timestamp) const
{
    std::string_view type = c.next();

    expectFields(c, type, kModeAckFields);

    ModeAckEvent ev;

    ev.phy = std::string(phy);
    ev.timestamp = timestamp;
    ev.kind = type == "rc_mode" ? ModeAckEvent::kRate : ModeAckEvent::kPower;
    ev.mac = parseMAC(c.next());
    ev.mode = parseMode(c.next());

    return ev;
}
