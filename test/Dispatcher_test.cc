// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <catch2/catch.hpp>

#include "Dispatcher.hh"
#include "Fakes.hh"

static const char *kTxsLine = "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;3;3;0;d7;1;ffff;0;ffff;0;ffff;0";

static const char *kAbsentLine = "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;1;0;0;ffff;0;ffff;0;ffff;0;ffff;0";

static const char *kAddLine = "phy0;16c4added930f1b4;sta;add;cc:32:e5:9d:ab:58;wlan0;auto;auto;a;14;32;a;3ff;ff";

static const char *kRemoveLine = "phy0;16c4added930f1b5;sta;remove;cc:32:e5:9d:ab:58";

static const char *kReAddLine = "phy0;16c4added930f1b6;sta;add;cc:32:e5:9d:ab:58;wlan0;auto;auto;a;14;32;a;3ff;ff";

struct DispatcherFixture {
    DispatcherFixture()
      : transport(std::make_shared<FakeTransport>())
      , ap(std::make_shared<AccessPoint>("ap0", transport))
      , registry(std::make_shared<StationRegistry>())
      , dispatcher(registry)
    {
        registry->addAccessPoint(ap);
    }

    std::shared_ptr<Station> station(void) const
    {
        return registry->lookup("ap0", testMac());
    }

    ConfigGuard guard;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<AccessPoint> ap;
    std::shared_ptr<StationRegistry> registry;
    Dispatcher dispatcher;
};

class RecordingListener : public DispatcherListener {
public:
    void eventDecoded(const std::string &ap, const Event &ev) override
    {
        events.push_back(eventName(ev));
    }

    void decodeFailed(const std::string &ap,
                      const std::string &line,
                      ErrorCode err) override
    {
        failures.push_back(line);
        errors.push_back(err);
    }

    std::vector<std::string> events;
    std::vector<std::string> failures;
    std::vector<ErrorCode> errors;
};

class RecordingRegistryListener : public StationRegistryListener {
public:
    void stationAdded(const std::shared_ptr<Station> &sta) override
    {
        ++added;
    }

    void stationRemoved(const std::shared_ptr<Station> &sta) override
    {
        ++removed;
    }

    unsigned added = 0;
    unsigned removed = 0;
};

class ThrowingRegistryListener : public StationRegistryListener {
public:
    void stationAdded(const std::shared_ptr<Station> &sta) override
    {
        throw std::runtime_error("listener failed");
    }
};

TEST_CASE("Lines from unknown access points are rejected", "[dispatcher]") {
    DispatcherFixture f;
    DispatchResult    result = f.dispatcher.process("ap1", kTxsLine);

    REQUIRE_FALSE(result.ok());
    REQUIRE_FALSE(result.event);
    REQUIRE(result.error == ErrorCode::kUnknownAccessPoint);
    REQUIRE(f.registry->size() == 0);
}

TEST_CASE("Transmission status creates a station and updates its statistics", "[dispatcher]") {
    DispatcherFixture f;
    DispatchResult    result = f.dispatcher.process("ap0", kTxsLine);

    REQUIRE(result.ok());
    REQUIRE(std::holds_alternative<TxStatusEvent>(*result.event));
    REQUIRE(f.registry->size() == 1);

    std::shared_ptr<Station> sta = f.station();

    REQUIRE(sta);
    REQUIRE_FALSE(sta->isAssociated());
    REQUIRE(sta->getPhy() == "phy0");

    std::optional<RateStats> stats = sta->getRateStats().get(0xd7, -1);

    REQUIRE(stats);
    REQUIRE(stats->attempts == 3);
    REQUIRE(stats->successes == 3);
    REQUIRE(stats->timestamp == 0x16c4added930f1b4ull);
}

TEST_CASE("Malformed lines leave state unchanged", "[dispatcher]") {
    DispatcherFixture f;

    REQUIRE(f.dispatcher.process("ap0", kTxsLine).ok());

    DispatchResult result = f.dispatcher.process("ap0", "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;zz;3;0;d7;1;ffff;0;ffff;0;ffff;0");

    REQUIRE_FALSE(result.event);
    REQUIRE(result.error == ErrorCode::kMalformedField);
    REQUIRE_FALSE(result.message.empty());
    REQUIRE(f.registry->size() == 1);
    REQUIRE(f.station()->getRateStats().get(0xd7, -1)->attempts == 3);
}

TEST_CASE("Lines with no attempted stage are valid", "[dispatcher]") {
    DispatcherFixture f;
    DispatchResult    result = f.dispatcher.process("ap0", kAbsentLine);

    REQUIRE(result.ok());
    REQUIRE(std::get<TxStatusEvent>(*result.event).mrr.npresent == 0);
    REQUIRE(f.registry->size() == 1);
    REQUIRE(f.station()->getRateStats().entries().empty());

    // The same line missing a field is malformed
    result = f.dispatcher.process("ap0", "phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;1;0;0;ffff;0;ffff;0;ffff;0;ffff");

    REQUIRE_FALSE(result.ok());
    REQUIRE_FALSE(result.event);
    REQUIRE(result.error == ErrorCode::kFieldCountMismatch);
}

TEST_CASE("Failures while applying an event are reported", "[dispatcher]") {
    DispatcherFixture f;
    auto              listener = std::make_shared<ThrowingRegistryListener>();

    f.registry->addListener(listener);

    DispatchResult result = f.dispatcher.process("ap0", kTxsLine);

    REQUIRE(result.event);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == ErrorCode::kRoutingFailed);
    REQUIRE(result.message == "listener failed");
}

TEST_CASE("Stations can be required to associate first", "[dispatcher]") {
    DispatcherFixture f;

    cfg.create_on_first_sight = false;

    DispatchResult result = f.dispatcher.process("ap0", kTxsLine);

    REQUIRE(result.event);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == ErrorCode::kUnknownStation);
    REQUIRE(f.registry->size() == 0);

    // Association always creates the station
    REQUIRE(f.dispatcher.process("ap0", kAddLine).ok());
    REQUIRE(f.dispatcher.process("ap0", kTxsLine).ok());
    REQUIRE(f.station()->getRateStats().get(0xd7, -1)->attempts == 3);
}

TEST_CASE("Mode acknowledgements for unknown stations are errors", "[dispatcher]") {
    DispatcherFixture f;
    DispatchResult    result = f.dispatcher.process("ap0", "phy0;16c4added930f1b4;rc_mode;cc:32:e5:9d:ab:58;manual");

    REQUIRE(result.error == ErrorCode::kUnknownStation);
    REQUIRE(f.registry->size() == 0);
}

TEST_CASE("Association and disassociation", "[dispatcher]") {
    DispatcherFixture f;

    REQUIRE(f.dispatcher.process("ap0", kAddLine).ok());

    std::shared_ptr<Station> sta = f.station();

    REQUIRE(sta->isAssociated());
    REQUIRE(sta->getInterface() == "wlan0");
    REQUIRE(sta->getSupportedRates().size() == 18);

    REQUIRE(f.dispatcher.process("ap0", "phy0;16c4added930f1b4;tpc_mode;cc:32:e5:9d:ab:58;manual").ok());
    REQUIRE(sta->getTpcMode() == ControlMode::kManual);

    REQUIRE(f.dispatcher.process("ap0", kRemoveLine).ok());

    REQUIRE_FALSE(sta->isAssociated());
    REQUIRE(sta->getTpcMode() == ControlMode::kAuto);
    REQUIRE(f.registry->size() == 0);

    // Removing a station twice is an error
    REQUIRE(f.dispatcher.process("ap0", kRemoveLine).error == ErrorCode::kUnknownStation);
}

TEST_CASE("Default rate control runs while a station is associated", "[dispatcher]") {
    DispatcherFixture f;
    auto              alg = std::make_shared<FakeAlgorithm>();

    f.registry->setDefaultRateControl(alg);

    REQUIRE(f.dispatcher.process("ap0", kAddLine).ok());

    std::shared_ptr<ControlTask> task = f.station()->getControlTask();

    REQUIRE(task);
    REQUIRE(waitForState(task, ControlTask::kRunning));

    SECTION("and is stopped on disassociation") {
        REQUIRE(f.dispatcher.process("ap0", kRemoveLine).ok());

        REQUIRE(task->getState() == ControlTask::kStopped);
        REQUIRE(f.registry->size() == 0);
    }

    SECTION("and is paused on disassociation when requested") {
        f.station()->setPauseOnDisassoc(true);

        REQUIRE(f.dispatcher.process("ap0", kRemoveLine).ok());

        REQUIRE(task->getState() == ControlTask::kPaused);
        REQUIRE(f.registry->size() == 1);

        REQUIRE(f.dispatcher.process("ap0", kReAddLine).ok());

        REQUIRE(task->getState() == ControlTask::kRunning);
        REQUIRE(waitFor([&]() { return alg->resume_calls == 1; }));
        REQUIRE(alg->configure_calls == 1);
        REQUIRE(f.station()->getControlTask() == task);
    }

    if (std::shared_ptr<Station> sta = f.station())
        sta->stopRateControl();
}

TEST_CASE("API version announcements", "[dispatcher]") {
    DispatcherFixture f;

    REQUIRE_FALSE(f.ap->getApiVersion());

    SECTION("supported") {
        REQUIRE(f.dispatcher.process("ap0", "*;0;orca_version;2;9").ok());
        REQUIRE(f.ap->getApiVersion() == std::make_pair(2u, 9u));
    }

    SECTION("unsupported") {
        DispatchResult result = f.dispatcher.process("ap0", "*;0;orca_version;3;0");

        REQUIRE(result.event);
        REQUIRE(result.error == ErrorCode::kUnsupportedApiVersion);
        REQUIRE(f.ap->getApiVersion() == std::make_pair(3u, 0u));
    }
}

TEST_CASE("Device errors are reported without failing", "[dispatcher]") {
    DispatcherFixture f;

    REQUIRE(f.dispatcher.process("ap0", "*;0;#error;bad;command").ok());
}

TEST_CASE("Dispatcher listeners see every line", "[dispatcher]") {
    DispatcherFixture f;
    auto              listener = std::make_shared<RecordingListener>();

    f.dispatcher.addListener(listener);

    f.dispatcher.process("ap0", kTxsLine);
    f.dispatcher.process("ap0", "phy0;16c4added930f1b4;frob;cc:32:e5:9d:ab:58\n");
    f.dispatcher.process("ap0", "*;0;orca_version;2;9");

    REQUIRE(listener->events == std::vector<std::string>{ "txs", "orca_version" });
    REQUIRE(listener->failures == std::vector<std::string>{ "phy0;16c4added930f1b4;frob;cc:32:e5:9d:ab:58" });
    REQUIRE(listener->errors == std::vector<ErrorCode>{ ErrorCode::kUnexpectedRecordType });

    f.dispatcher.removeListener(listener);
    f.dispatcher.process("ap0", kTxsLine);

    REQUIRE(listener->events.size() == 2);
}

TEST_CASE("Registry listeners see stations come and go", "[dispatcher]") {
    DispatcherFixture f;
    auto              listener = std::make_shared<RecordingRegistryListener>();

    f.registry->addListener(listener);

    f.dispatcher.process("ap0", kTxsLine);
    f.dispatcher.process("ap0", kTxsLine);

    REQUIRE(listener->added == 1);
    REQUIRE(listener->removed == 0);

    f.dispatcher.process("ap0", kAddLine);
    f.dispatcher.process("ap0", kRemoveLine);

    REQUIRE(listener->added == 1);
    REQUIRE(listener->removed == 1);
}
