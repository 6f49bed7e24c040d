// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdexcept>

#include "Errors.hh"
#include "StationRegistry.hh"
#include "logging.hh"

StationRegistry::~StationRegistry()
{
    for (auto&& it : stations_) {
        if (auto task = it.second->getControlTask())
            task->stop();
    }
}

void StationRegistry::addAccessPoint(const std::shared_ptr<AccessPoint> &ap)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto&                 [it, created] = aps_.try_emplace(ap->getName(), ap);

    if (!created)
        throw std::invalid_argument("Access point already exists: " + ap->getName());

    logStation(LOGINFO, "added access point %s", ap->getName().c_str());
}

void StationRegistry::removeAccessPoint(const std::string &name)
{
    std::vector<std::shared_ptr<Station>> removed;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        aps_.erase(name);

        for (auto it = stations_.begin(); it != stations_.end();) {
            if (it->first.first == name) {
                removed.push_back(it->second);
                it = stations_.erase(it);
            } else
                ++it;
        }
    }

    for (auto&& sta : removed) {
        sta->stopRateControl();
        notify([=](StationRegistryListener &listener) { listener.stationRemoved(sta); });
    }
}

std::shared_ptr<AccessPoint> StationRegistry::getAccessPoint(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = aps_.find(name);

    if (it == aps_.end())
        return nullptr;

    return it->second;
}

std::vector<std::shared_ptr<AccessPoint>> StationRegistry::getAccessPoints(void) const
{
    std::lock_guard<std::mutex>               lock(mutex_);
    std::vector<std::shared_ptr<AccessPoint>> aps;

    for (auto&& it : aps_)
        aps.push_back(it.second);

    return aps;
}

std::shared_ptr<Station> StationRegistry::lookup(const std::string &ap_name,
                                                 const MacAddr &mac) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = stations_.find(Key(ap_name, mac));

    if (it == stations_.end())
        return nullptr;

    return it->second;
}

std::shared_ptr<Station> StationRegistry::getOrCreate(const std::string &ap_name,
                                                      const std::string &phy,
                                                      const MacAddr &mac)
{
    std::shared_ptr<Station>              sta;
    std::shared_ptr<RateControlAlgorithm> alg;
    AlgorithmOptions                      opts;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        ap_it = aps_.find(ap_name);

        if (ap_it == aps_.end())
            throw LookupError(ErrorCode::kUnknownAccessPoint, "Unknown access point: " + ap_name);

        // Pass nullptr so we don't construct a station if one already exists
        const auto& [it, created] = stations_.try_emplace(Key(ap_name, mac), nullptr);

        if (!created)
            return it->second;

        sta = std::make_shared<Station>(ap_it->second, phy, mac);
        it->second = sta;
        alg = default_alg_;
        opts = default_opts_;
    }

    logStation(LOGINFO, "%s: new station on %s/%s",
        mac.toString().c_str(),
        ap_name.c_str(),
        phy.c_str());

    if (alg)
        sta->startRateControl(alg, opts);

    notify([=](StationRegistryListener &listener) { listener.stationAdded(sta); });

    return sta;
}

std::shared_ptr<Station> StationRegistry::remove(const std::string &ap_name,
                                                 const MacAddr &mac)
{
    std::shared_ptr<Station> sta;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = stations_.find(Key(ap_name, mac));

        if (it == stations_.end())
            return nullptr;

        sta = it->second;
        stations_.erase(it);
    }

    notify([=](StationRegistryListener &listener) { listener.stationRemoved(sta); });

    return sta;
}
