// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "stats/RateStatsTable.hh"

static MrrChain mkChain(std::initializer_list<MrrStage> stages)
{
    MrrChain chain;
    unsigned i = 0;

    for (const auto &stage : stages)
        chain.stages[i++] = stage;

    return chain;
}

static MrrStage mkStage(int rate, int txpower, uint64_t attempts, uint64_t successes)
{
    MrrStage stage;

    stage.rate = rate;
    stage.count = 1;
    stage.txpower = txpower;
    stage.attempts = attempts;
    stage.successes = successes;

    return stage;
}

TEST_CASE("New table is empty", "[stats]") {
    RateStatsTable table(16, 4);

    REQUIRE(table.getNumRates() == 16);
    REQUIRE(table.getNumTxPowers() == 4);
    REQUIRE(table.get(0, 0) == RateStats{});
    REQUIRE(table.get(-1, -1) == RateStats{});
    REQUIRE(table.entries().empty());
}

TEST_CASE("Out of bounds cells cannot be read", "[stats]") {
    RateStatsTable table(16, 4);

    REQUIRE_FALSE(table.get(16, 0));
    REQUIRE_FALSE(table.get(0, 4));
    REQUIRE_FALSE(table.get(-2, 0));
}

TEST_CASE("Stages accumulate into their cells", "[stats]") {
    RateStatsTable table(16, 4);

    table.update(100, mkChain({mkStage(3, 1, 6, 0), mkStage(2, 1, 3, 3)}));
    table.update(200, mkChain({mkStage(2, 1, 2, 1)}));

    REQUIRE(table.get(3, 1)->attempts == 6);
    REQUIRE(table.get(3, 1)->successes == 0);
    REQUIRE(table.get(3, 1)->timestamp == 100);

    REQUIRE(table.get(2, 1)->attempts == 5);
    REQUIRE(table.get(2, 1)->successes == 4);
    REQUIRE(table.get(2, 1)->timestamp == 200);

    REQUIRE(table.entries().size() == 2);
}

TEST_CASE("Unknown rates and powers go to the sentinel cells", "[stats]") {
    RateStatsTable table(16, 4);

    table.update(1, mkChain({mkStage(300, 1, 1, 1)}));
    table.update(2, mkChain({mkStage(5, kAbsentTxPower, 2, 1)}));
    table.update(3, mkChain({mkStage(5, 9, 4, 0)}));
    table.update(4, kAbsentRate, kAbsentTxPower, 8, 8);

    REQUIRE(table.get(-1, 1)->attempts == 1);
    REQUIRE(table.get(-1, -1)->attempts == 8);
    REQUIRE(table.get(5, -1)->attempts == 6);
    REQUIRE(table.get(5, -1)->successes == 1);

    for (int rate = 0; rate < 16; ++rate)
        for (int txpower = 0; txpower < 4; ++txpower)
            REQUIRE(table.get(rate, txpower)->attempts == 0);
}

TEST_CASE("Absent stages are ignored", "[stats]") {
    RateStatsTable table(16, 4);
    MrrChain       chain;

    table.update(1, chain);

    REQUIRE(table.entries().empty());
}

TEST_CASE("Automatic power accounting adds to the unknown power column", "[stats]") {
    RateStatsTable table(16, 4);

    table.update(1, mkChain({mkStage(5, 2, 4, 1), mkStage(6, kAbsentTxPower, 2, 2)}), true);

    REQUIRE(table.get(5, 2)->attempts == 4);
    REQUIRE(table.get(5, -1)->attempts == 4);
    REQUIRE(table.get(5, -1)->successes == 1);

    // A stage without power is only counted once
    REQUIRE(table.get(6, -1)->attempts == 2);
}

TEST_CASE("Reset and clear", "[stats]") {
    RateStatsTable table(16, 4);

    table.update(1, 3, 1, 1, 1);

    SECTION("reset grows and zeroes") {
        table.reset(32, 8);

        REQUIRE(table.getNumRates() == 32);
        REQUIRE(table.getNumTxPowers() == 8);
        REQUIRE(table.get(3, 1)->attempts == 0);
        REQUIRE(table.get(31, 7));
    }

    SECTION("reset cannot shrink") {
        REQUIRE_THROWS_AS(table.reset(8, 4), std::invalid_argument);
        REQUIRE(table.get(3, 1)->attempts == 1);
    }

    SECTION("clear keeps dimensions") {
        table.clear();

        REQUIRE(table.getNumRates() == 16);
        REQUIRE(table.entries().empty());
    }
}

TEST_CASE("Readers never see a torn cell", "[stats]") {
    RateStatsTable    table(4, 1);
    std::atomic<bool> done(false);
    bool              consistent = true;

    std::thread writer([&]() {
        for (unsigned i = 0; i < 10000; ++i)
            table.update(i, mkChain({mkStage(1, 0, 2, 1)}));

        done = true;
    });

    while (!done) {
        std::optional<RateStats> stats = table.get(1, 0);

        if (!stats || stats->attempts != 2*stats->successes)
            consistent = false;
    }

    writer.join();

    REQUIRE(consistent);
    REQUIRE(table.get(1, 0)->attempts == 20000);
}
