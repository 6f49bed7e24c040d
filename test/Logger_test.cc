// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdlib.h>
#include <unistd.h>

#include <catch2/catch.hpp>

#include <H5Cpp.h>

#include "Logger.hh"

static hssize_t numRecords(const H5::H5File &file, const std::string &name)
{
    return file.openDataSet(name).getSpace().getSimpleExtentNpoints();
}

TEST_CASE("Logger writes collected sources to HDF5", "[logger]") {
    char path[] = "/tmp/ratectl-log-XXXXXX";
    int  fd = mkstemp(path);

    REQUIRE(fd != -1);
    ::close(fd);

    TxStatusEvent txs;

    txs.phy = "phy0";
    txs.timestamp = 0x16c4added930f1b4ull;
    txs.mac = parseMAC("cc:32:e5:9d:ab:58");
    txs.num_frames = 3;
    txs.num_acked = 3;
    txs.mrr.stages[0].rate = 0xd7;
    txs.mrr.stages[0].count = 1;
    txs.mrr.npresent = 1;
    txs.mrr.credited = 0;

    {
        Logger log(WallClock::now(), MonoClock::now());

        log.setCollectSource(Logger::kTxStatus, true);
        log.setCollectSource(Logger::kCommands, true);

        REQUIRE(log.getCollectSource(Logger::kTxStatus));
        REQUIRE_FALSE(log.getCollectSource(Logger::kRateStats));

        log.open(path);

        REQUIRE(log.isOpen());

        log.setAttribute("start", static_cast<int64_t>(1640627336));
        log.setAttribute("hostname", std::string("ap0"));

        log.logTxStatus(MonoClock::now(), "ap0", txs);
        log.logTxStatus(MonoClock::now(), "ap0", txs);
        log.logCommand(MonoClock::now(), "ap0", "phy0;manual");
        log.logRateStats(MonoClock::now(), "ap0", RateStatsEvent{});
        log.logEvent(MonoClock::now(), "ignored");

        log.close();

        REQUIRE_FALSE(log.isOpen());
    }

    {
        H5::H5File file(path, H5F_ACC_RDONLY);

        REQUIRE(numRecords(file, "txs") == 2);
        REQUIRE(numRecords(file, "command") == 1);
        REQUIRE(numRecords(file, "stats") == 0);
        REQUIRE(numRecords(file, "event") == 0);
        REQUIRE(file.attrExists("start"));
        REQUIRE(file.attrExists("hostname"));
    }

    unlink(path);
}
