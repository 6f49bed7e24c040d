// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "ControllerConfig.hh"
#include "Dispatcher.hh"
#include "Logger.hh"
#include "logging.hh"
#include "proto/LineDecoder.hh"
#include "util/ssprintf.hh"

Dispatcher::Dispatcher(std::shared_ptr<StationRegistry> registry)
  : registry_(registry)
{
}

DispatchResult Dispatcher::process(const std::string &ap_name, std::string_view line)
{
    DispatchResult               result;
    std::shared_ptr<AccessPoint> ap = registry_->getAccessPoint(ap_name);

    if (!ap) {
        result.error = ErrorCode::kUnknownAccessPoint;
        result.message = "Unknown access point: " + ap_name;
        logProto(LOGWARNING, "%s", result.message.c_str());
        return result;
    }

    try {
        result.event = ap->getDecoder().decode(line);
    } catch (const DecodeError &e) {
        std::string l(chomp(line));

        result.error = e.code();
        result.message = e.what();

        logProto(LOGDEBUG, "%s: %s: %s (line: %s)",
            ap_name.c_str(),
            errorCode2string(e.code()),
            e.what(),
            l.c_str());

        notify([&](DispatcherListener &listener) { listener.decodeFailed(ap_name, l, e.code()); });

        return result;
    }

    try {
        route(ap, *result.event, result);
    } catch (const RatectlError &e) {
        result.error = e.code();
        result.message = e.what();
        logStation(LOGWARNING, "%s: %s: %s",
            ap_name.c_str(),
            errorCode2string(e.code()),
            e.what());
    } catch (const std::exception &e) {
        result.error = ErrorCode::kRoutingFailed;
        result.message = e.what();
        logStation(LOGERROR, "%s: failed to apply %s event: %s",
            ap_name.c_str(),
            eventName(*result.event),
            e.what());
    }

    notify([&](DispatcherListener &listener) { listener.eventDecoded(ap_name, *result.event); });

    return result;
}

std::shared_ptr<Station> Dispatcher::findStation(const std::shared_ptr<AccessPoint> &ap,
                                                 const std::string &phy,
                                                 const MacAddr &mac,
                                                 bool create)
{
    std::shared_ptr<Station> sta = registry_->lookup(ap->getName(), mac);

    if (!sta && create)
        sta = registry_->getOrCreate(ap->getName(), phy, mac);

    if (!sta)
        throw LookupError(ErrorCode::kUnknownStation,
                          "Unknown station: " + mac.toString());

    return sta;
}

void Dispatcher::route(const std::shared_ptr<AccessPoint> &ap,
                       const Event &ev,
                       DispatchResult &result)
{
    if (auto txs = std::get_if<TxStatusEvent>(&ev)) {
        std::shared_ptr<Station> sta = findStation(ap, txs->phy, txs->mac, cfg.create_on_first_sight);

        if (!sta->applyTxStatus(*txs))
            logStation(LOGDEBUG, "%s: dropped stale txs", txs->mac.toString().c_str());

        if (logger)
            logger->logTxStatus(MonoClock::now(), ap->getName(), *txs);
    } else if (auto stats = std::get_if<RateStatsEvent>(&ev)) {
        findStation(ap, stats->phy, stats->mac, cfg.create_on_first_sight);

        if (logger)
            logger->logRateStats(MonoClock::now(), ap->getName(), *stats);
    } else if (auto rxs = std::get_if<RxStatusEvent>(&ev)) {
        std::shared_ptr<Station> sta = findStation(ap, rxs->phy, rxs->mac, cfg.create_on_first_sight);

        if (!sta->applyRxStatus(*rxs))
            logStation(LOGDEBUG, "%s: dropped stale rxs", rxs->mac.toString().c_str());
    } else if (auto add = std::get_if<StationAddEvent>(&ev)) {
        std::shared_ptr<Station> sta = findStation(ap, add->phy, add->mac, true);

        sta->onAssociated(*add);
    } else if (auto remove = std::get_if<StationRemoveEvent>(&ev)) {
        std::shared_ptr<Station>     sta = findStation(ap, remove->phy, remove->mac, false);
        std::shared_ptr<ControlTask> task;

        sta->onDisassociated(remove->timestamp);

        // A station whose task was paused is kept so that it can be resumed
        task = sta->getControlTask();
        if (sta->getPauseOnDisassoc() && task && task->getState() != ControlTask::kStopped)
            return;

        registry_->remove(ap->getName(), remove->mac);
    } else if (auto ack = std::get_if<ModeAckEvent>(&ev)) {
        std::shared_ptr<Station> sta = findStation(ap, ack->phy, ack->mac, false);

        sta->applyModeAck(*ack);
    } else if (auto err = std::get_if<DeviceErrorEvent>(&ev)) {
        ap->handleError(err->message);
    } else if (auto version = std::get_if<ApiVersionEvent>(&ev)) {
        ap->setApiVersion(version->major, version->minor);

        if (!version->isSupported()) {
            result.error = ErrorCode::kUnsupportedApiVersion;
            result.message = ssprintf("Unsupported API version %u.%u (expected %u.%u)",
                                      version->major,
                                      version->minor,
                                      kApiVersionMajor,
                                      kApiVersionMinor);
            logNet(LOGERROR, "%s: %s", ap->getName().c_str(), result.message.c_str());
        }
    }
}
