// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <catch2/catch.hpp>

#include <string>

#include "Errors.hh"
#include "proto/LineDecoder.hh"
#include "stats/RateStatsTable.hh"

static const char *kTxsLine = "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0";

static ErrorCode decodeError(const LineDecoder &decoder, const std::string &line)
{
    try {
        decoder.decode(line);
    } catch (const DecodeError &e) {
        return e.code();
    }

    FAIL("line decoded without error: " << line);
    return ErrorCode::kMalformedField;
}

TEST_CASE("Decode transmission status in pair layout", "[decoder]") {
    LineDecoder   decoder;
    TxStatusEvent ev = decoder.decodeTxStatus(kTxsLine);

    REQUIRE(ev.phy == "phy0");
    REQUIRE(ev.timestamp == 0x16c4added930f1b4ull);
    REQUIRE(ev.mac.toString() == "cc:32:e5:9d:ab:58");
    REQUIRE(ev.num_frames == 3);
    REQUIRE(ev.num_acked == 3);
    REQUIRE_FALSE(ev.probe);

    REQUIRE(ev.mrr.stages[0].rate == 0xd7);
    REQUIRE(ev.mrr.stages[0].count == 1);
    REQUIRE(ev.mrr.stages[0].txpower == kAbsentTxPower);
    REQUIRE(ev.mrr.stages[0].attempts == 3);
    REQUIRE(ev.mrr.stages[0].successes == 3);

    for (unsigned i = 1; i < kMaxMrrStages; ++i) {
        REQUIRE_FALSE(ev.mrr.stages[i].isPresent());
        REQUIRE(ev.mrr.stages[i].attempts == 0);
        REQUIRE(ev.mrr.stages[i].successes == 0);
    }

    REQUIRE(ev.mrr.npresent == 1);
    REQUIRE(ev.mrr.credited == 0u);
}

TEST_CASE("Decode transmission status with seconds and nanoseconds", "[decoder]") {
    LineDecoder   decoder(TimestampFormat::kSecNsec);
    TxStatusEvent ev = decoder.decodeTxStatus("phy0;1640627336;907911604;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0");

    REQUIRE(ev.timestamp == 1640627336907911604ull);
    REQUIRE(ev.mac == parseMAC("cc:32:e5:9d:ab:58"));
    REQUIRE(ev.mrr.credited == 0u);

    // The hex format rejects the two-field timestamp
    REQUIRE(decodeError(LineDecoder(TimestampFormat::kHex),
                        "phy0;1640627336;907911604;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
            == ErrorCode::kMalformedTimestamp);
}

TEST_CASE("Decode transmission status in tuple layout", "[decoder]") {
    LineDecoder   decoder;
    TxStatusEvent ev = decoder.decodeTxStatus("phy1;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;a;8;1;d7,2,5;c6,3;,,;0,0\n");

    REQUIRE(ev.phy == "phy1");
    REQUIRE(ev.num_frames == 10);
    REQUIRE(ev.num_acked == 8);
    REQUIRE(ev.probe);

    REQUIRE(ev.mrr.stages[0].rate == 0xd7);
    REQUIRE(ev.mrr.stages[0].count == 2);
    REQUIRE(ev.mrr.stages[0].txpower == 5);
    REQUIRE(ev.mrr.stages[0].attempts == 20);
    REQUIRE(ev.mrr.stages[0].successes == 0);

    REQUIRE(ev.mrr.stages[1].rate == 0xc6);
    REQUIRE(ev.mrr.stages[1].count == 3);
    REQUIRE(ev.mrr.stages[1].txpower == kAbsentTxPower);
    REQUIRE(ev.mrr.stages[1].attempts == 30);
    REQUIRE(ev.mrr.stages[1].successes == 8);

    REQUIRE_FALSE(ev.mrr.stages[2].isPresent());
    REQUIRE_FALSE(ev.mrr.stages[3].isPresent());

    REQUIRE(ev.mrr.npresent == 2);
    REQUIRE(ev.mrr.credited == 1u);
}

TEST_CASE("No stage is credited when nothing was acknowledged", "[decoder]") {
    LineDecoder   decoder;
    TxStatusEvent ev = decoder.decodeTxStatus("phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;2;0;0;d7;2;c6;2;ffff;0;ffff;0");

    REQUIRE(ev.mrr.npresent == 2);
    REQUIRE_FALSE(ev.mrr.credited);
    REQUIRE(ev.mrr.stages[0].attempts == 4);
    REQUIRE(ev.mrr.stages[1].attempts == 4);
    REQUIRE(ev.mrr.stages[0].successes == 0);
    REQUIRE(ev.mrr.stages[1].successes == 0);
}

TEST_CASE("A line with every stage absent attempts nothing", "[decoder]") {
    LineDecoder    decoder;
    TxStatusEvent  ev = decoder.decodeTxStatus("phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;1;0;0;ffff;0;ffff;0;ffff;0;ffff;0");
    RateStatsTable table(16, 4);

    REQUIRE(ev.num_frames == 1);
    REQUIRE(ev.mrr.npresent == 0);
    REQUIRE_FALSE(ev.mrr.credited);

    for (const auto &stage : ev.mrr.stages) {
        REQUIRE_FALSE(stage.isPresent());
        REQUIRE(stage.attempts == 0);
        REQUIRE(stage.successes == 0);
    }

    table.update(ev.timestamp, ev.mrr);

    REQUIRE(table.entries().empty());
}

TEST_CASE("The last attempted stage is credited even after a gap", "[decoder]") {
    LineDecoder   decoder;
    TxStatusEvent ev = decoder.decodeTxStatus("phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;2;2;0;ffff;0;c6;3;ffff;0;ffff;0");

    REQUIRE(ev.mrr.npresent == 1);
    REQUIRE_FALSE(ev.mrr.stages[0].isPresent());
    REQUIRE(ev.mrr.credited == 1u);
    REQUIRE(ev.mrr.stages[1].rate == 0xc6);
    REQUIRE(ev.mrr.stages[1].attempts == 6);
    REQUIRE(ev.mrr.stages[1].successes == 2);
}

TEST_CASE("Decode kernel rate statistics", "[decoder]") {
    LineDecoder decoder;

    for (const char *type : {"stats", "rcs"}) {
        Event ev = decoder.decode(std::string("phy0;16c4added930f1b4;") + type + ";cc:32:e5:9d:ab:58;d7;5dc;1f4;3;4;64;c8");

        REQUIRE(std::holds_alternative<RateStatsEvent>(ev));

        const RateStatsEvent &stats = std::get<RateStatsEvent>(ev);

        REQUIRE(stats.rate == 0xd7);
        REQUIRE(stats.avg_prob == 1500);
        REQUIRE(stats.avg_tp == 500);
        REQUIRE(stats.cur_success == 3);
        REQUIRE(stats.cur_attempts == 4);
        REQUIRE(stats.hist_success == 100);
        REQUIRE(stats.hist_attempts == 200);
    }
}

TEST_CASE("Decode signal strength", "[decoder]") {
    LineDecoder decoder;
    Event       ev = decoder.decode("phy0;16c4added930f1b4;rxs;cc:32:e5:9d:ab:58;ffffffc4;ffffffc4;ffffffc0;;");

    REQUIRE(std::holds_alternative<RxStatusEvent>(ev));

    const RxStatusEvent &rxs = std::get<RxStatusEvent>(ev);

    REQUIRE(rxs.min_rssi == -60);
    REQUIRE(rxs.rssi[0] == -60);
    REQUIRE(rxs.rssi[1] == -64);
    REQUIRE_FALSE(rxs.rssi[2]);
    REQUIRE_FALSE(rxs.rssi[3]);
}

TEST_CASE("Decode station records", "[decoder]") {
    LineDecoder decoder;

    SECTION("add") {
        Event ev = decoder.decode("phy0;16c4added930f1b4;sta;add;cc:32:e5:9d:ab:58;wlan0;manual;auto;a;14;32;a;3ff;ff");

        REQUIRE(std::holds_alternative<StationAddEvent>(ev));

        const StationAddEvent &add = std::get<StationAddEvent>(ev);

        REQUIRE(add.kind == StationAddEvent::kAdd);
        REQUIRE(add.iface == "wlan0");
        REQUIRE(add.rc_mode == ControlMode::kManual);
        REQUIRE(add.tpc_mode == ControlMode::kAuto);
        REQUIRE(add.overhead_mcs == 10);
        REQUIRE(add.overhead_legacy == 20);
        REQUIRE(add.update_freq == 50);
        REQUIRE(add.sample_freq == 10);
        REQUIRE(add.group_masks == std::vector<uint16_t>{0x3ff, 0xff});

        std::vector<int> rates = add.supportedRates();

        REQUIRE(rates.size() == 18);
        REQUIRE(rates.front() == 0);
        REQUIRE(rates[9] == 9);
        REQUIRE(rates[10] == 16);
        REQUIRE(rates.back() == 23);
    }

    SECTION("update without rate groups") {
        Event ev = decoder.decode("phy0;16c4added930f1b4;sta;update;cc:32:e5:9d:ab:58;wlan0;0;1;0;0;0;0");

        REQUIRE(std::holds_alternative<StationAddEvent>(ev));
        REQUIRE(std::get<StationAddEvent>(ev).kind == StationAddEvent::kUpdate);
        REQUIRE(std::get<StationAddEvent>(ev).tpc_mode == ControlMode::kManual);
        REQUIRE(std::get<StationAddEvent>(ev).group_masks.empty());
    }

    SECTION("remove") {
        Event ev = decoder.decode("phy0;16c4added930f1b4;sta;remove;cc:32:e5:9d:ab:58");

        REQUIRE(std::holds_alternative<StationRemoveEvent>(ev));
        REQUIRE(std::get<StationRemoveEvent>(ev).mac == parseMAC("cc:32:e5:9d:ab:58"));
    }

    SECTION("truncated add") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;sta;add;cc:32:e5:9d:ab:58;wlan0;manual;auto;a;14;32")
                == ErrorCode::kFieldCountMismatch);
    }

    SECTION("unknown station record") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;sta;frob;cc:32:e5:9d:ab:58")
                == ErrorCode::kUnexpectedRecordType);
    }
}

TEST_CASE("Decode mode acknowledgements", "[decoder]") {
    LineDecoder decoder;
    Event       rc = decoder.decode("phy0;16c4added930f1b4;rc_mode;cc:32:e5:9d:ab:58;manual");
    Event       tpc = decoder.decode("phy0;16c4added930f1b4;tpc_mode;cc:32:e5:9d:ab:58;0");

    REQUIRE(std::get<ModeAckEvent>(rc).kind == ModeAckEvent::kRate);
    REQUIRE(std::get<ModeAckEvent>(rc).mode == ControlMode::kManual);
    REQUIRE(std::get<ModeAckEvent>(tpc).kind == ModeAckEvent::kPower);
    REQUIRE(std::get<ModeAckEvent>(tpc).mode == ControlMode::kAuto);

    REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;rc_mode;cc:32:e5:9d:ab:58;sometimes")
            == ErrorCode::kMalformedField);
}

TEST_CASE("Decode header lines", "[decoder]") {
    LineDecoder decoder;

    Event version = decoder.decode("*;0;orca_version;2;9");

    REQUIRE(std::holds_alternative<ApiVersionEvent>(version));
    REQUIRE(std::get<ApiVersionEvent>(version).major == 2);
    REQUIRE(std::get<ApiVersionEvent>(version).minor == 9);
    REQUIRE(std::get<ApiVersionEvent>(version).isSupported());

    Event old = decoder.decode("*;0;orca_version;2;8");

    REQUIRE_FALSE(std::get<ApiVersionEvent>(old).isSupported());

    Event err = decoder.decode("*;0;#error;bad;command\r\n");

    REQUIRE(std::holds_alternative<DeviceErrorEvent>(err));
    REQUIRE(std::get<DeviceErrorEvent>(err).message == "bad;command");

    REQUIRE(decodeError(decoder, "*;0;frob;1") == ErrorCode::kUnexpectedRecordType);
    REQUIRE(decodeError(decoder, "*;0;orca_version;2") == ErrorCode::kFieldCountMismatch);
}

TEST_CASE("Malformed lines are rejected with the right error", "[decoder]") {
    LineDecoder decoder;

    SECTION("missing field") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff")
                == ErrorCode::kFieldCountMismatch);
    }

    SECTION("extra field") {
        REQUIRE(decodeError(decoder, std::string(kTxsLine) + ";0")
                == ErrorCode::kFieldCountMismatch);
    }

    SECTION("short timestamp") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedTimestamp);
    }

    SECTION("non-hex timestamp") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1bg;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedTimestamp);
    }

    SECTION("short nanoseconds") {
        REQUIRE(decodeError(LineDecoder(TimestampFormat::kSecNsec),
                            "phy0;1640627336;90791160;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedTimestamp);
    }

    SECTION("bad address") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedAddress);
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;txs;cc-32-e5-9d-ab-58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedAddress);
    }

    SECTION("bad frame count") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;zz;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedField);
    }

    SECTION("bad radio identifier") {
        REQUIRE(decodeError(decoder, ";16c4added930f1b4;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedField);
        REQUIRE(decodeError(decoder, "phy0123456789abcd;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0")
                == ErrorCode::kMalformedField);
    }

    SECTION("unknown record type") {
        REQUIRE(decodeError(decoder, "phy0;16c4added930f1b4;frob;cc:32:e5:9d:ab:58")
                == ErrorCode::kUnexpectedRecordType);
    }

    SECTION("empty line") {
        REQUIRE(decodeError(decoder, "") == ErrorCode::kMalformedField);
    }

    SECTION("not a transmission status line") {
        REQUIRE_THROWS_AS(decoder.decodeTxStatus("phy0;16c4added930f1b4;stats;cc:32:e5:9d:ab:58;d7;5dc;1f4;3;4;64;c8"),
                          DecodeError);
    }
}
