// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <catch2/catch.hpp>

#include <stdexcept>

#include "proto/Command.hh"

TEST_CASE("Mode commands", "[command]") {
    REQUIRE(cmd::rcMode("phy0", ControlMode::kManual) == "phy0;manual");
    REQUIRE(cmd::rcMode("phy0", ControlMode::kAuto) == "phy0;auto");
    REQUIRE(cmd::tpcMode("phy1", ControlMode::kManual) == "phy1;manual_tpc");
    REQUIRE(cmd::tpcMode("phy1", ControlMode::kAuto) == "phy1;auto_tpc");
}

TEST_CASE("Rate and power table commands", "[command]") {
    MacAddr mac = parseMAC("cc:32:e5:9d:ab:58");

    REQUIRE(cmd::setRates("phy0", mac, {0xd7, 0xc6, 0x10}, {1, 2, 10})
            == "phy0;rates;cc:32:e5:9d:ab:58;d7,c6,10;1,2,a");
    REQUIRE(cmd::setPower("phy0", mac, {10, 20})
            == "phy0;power;cc:32:e5:9d:ab:58;a,14");
    REQUIRE(cmd::setRatesPower("phy0", mac, {0xd7}, {1}, {0x1f})
            == "phy0;rates_power;cc:32:e5:9d:ab:58;d7;1;1f");
}

TEST_CASE("Malformed tables are rejected", "[command]") {
    MacAddr mac = parseMAC("cc:32:e5:9d:ab:58");

    REQUIRE_THROWS_AS(cmd::setRates("phy0", mac, {}, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(cmd::setRates("phy0", mac, {1, 2}, {1}), std::invalid_argument);
    REQUIRE_THROWS_AS(cmd::setRates("phy0", mac, {1, 2, 3, 4, 5}, {1, 1, 1, 1, 1}), std::invalid_argument);
    REQUIRE_THROWS_AS(cmd::setRates("phy0", mac, {-1}, {1}), std::invalid_argument);
    REQUIRE_THROWS_AS(cmd::setPower("phy0", mac, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(cmd::setRatesPower("phy0", mac, {1, 2}, {1, 1}, {3}), std::invalid_argument);
}

TEST_CASE("Probe and statistics commands", "[command]") {
    MacAddr mac = parseMAC("cc:32:e5:9d:ab:58");

    REQUIRE(cmd::probe("phy0", mac, 0xd7) == "phy0;probe;cc:32:e5:9d:ab:58;d7");
    REQUIRE(cmd::probe("phy0", mac, 0xd7, 5) == "phy0;probe;cc:32:e5:9d:ab:58;d7;5");
    REQUIRE_THROWS_AS(cmd::probe("phy0", mac, -1), std::invalid_argument);

    REQUIRE(cmd::resetStats("phy0", mac) == "phy0;reset_stats;cc:32:e5:9d:ab:58");

    REQUIRE(cmd::startEvents("phy0", {"txs", "stats"}) == "phy0;start;txs;stats");
    REQUIRE(cmd::stopEvents("phy0", {"rxs"}) == "phy0;stop;rxs");
}
