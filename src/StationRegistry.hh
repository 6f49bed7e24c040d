// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef STATIONREGISTRY_HH_
#define STATIONREGISTRY_HH_

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "AccessPoint.hh"
#include "Station.hh"
#include "rc/RateControlAlgorithm.hh"

/** @brief A listener for station registry events */
class StationRegistryListener
{
public:
    StationRegistryListener() = default;

    virtual ~StationRegistryListener() = default;

    /** @brief Called when a station is added
     * @param sta The station that was added
     * */
    virtual void stationAdded(const std::shared_ptr<Station> &sta)
    {
    }

    /** @brief Called when a station is removed
     * @param sta The station that was removed
     * */
    virtual void stationRemoved(const std::shared_ptr<Station> &sta)
    {
    }
};

/** @brief All known access points and their stations */
class StationRegistry
{
public:
    /** @brief Stations are identified by access point name and address */
    using Key = std::pair<std::string, MacAddr>;

    using StationMap = std::map<Key, std::shared_ptr<Station>>;

    StationRegistry() = default;

    ~StationRegistry();

    StationRegistry(const StationRegistry&) = delete;
    StationRegistry(StationRegistry&&) = delete;

    StationRegistry& operator=(const StationRegistry&) = delete;
    StationRegistry& operator=(StationRegistry&&) = delete;

    /** @brief Add an access point
     * @throw std::invalid_argument if an access point of the same name exists
     */
    void addAccessPoint(const std::shared_ptr<AccessPoint> &ap);

    /** @brief Remove an access point and all of its stations */
    void removeAccessPoint(const std::string &name);

    /** @brief Get an access point
     * @return The access point, or nullptr if there is none by that name
     */
    std::shared_ptr<AccessPoint> getAccessPoint(const std::string &name) const;

    /** @brief Get all access points */
    std::vector<std::shared_ptr<AccessPoint>> getAccessPoints(void) const;

    /** @brief Look up a station
     * @return The station, or nullptr if it is not known
     */
    std::shared_ptr<Station> lookup(const std::string &ap_name,
                                    const MacAddr &mac) const;

    /** @brief Look up a station, creating it if it is not known
     * A newly created station has the default rate control algorithm, if
     * any, attached.
     * @throw LookupError if the access point is not known
     */
    std::shared_ptr<Station> getOrCreate(const std::string &ap_name,
                                         const std::string &phy,
                                         const MacAddr &mac);

    /** @brief Remove a station
     * @return The removed station, or nullptr if it was not known
     */
    std::shared_ptr<Station> remove(const std::string &ap_name,
                                    const MacAddr &mac);

    /** @brief Get all stations */
    StationMap getStations(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return stations_;
    }

    /** @brief Return the number of stations */
    size_t size(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return stations_.size();
    }

    /** @brief Apply a function to each station */
    template <typename F>
    void foreach(F&& f) const
    {
        for (auto&& it : getStations())
            f(*(it.second));
    }

    /** @brief Set the algorithm attached to newly created stations */
    void setDefaultRateControl(std::shared_ptr<RateControlAlgorithm> alg,
                               const AlgorithmOptions &opts = {})
    {
        std::lock_guard<std::mutex> lock(mutex_);

        default_alg_ = alg;
        default_opts_ = opts;
    }

    /** @brief Get the algorithm attached to newly created stations */
    std::shared_ptr<RateControlAlgorithm> getDefaultRateControl(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return default_alg_;
    }

    /** @brief Add a listener
     * @param listener The listener to add
     */
    void addListener(const std::shared_ptr<StationRegistryListener> &listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        listeners_.insert(listener);
    }

    /** @brief Remove a listener
     * @param listener The listener to remove
     */
    void removeListener(const std::shared_ptr<StationRegistryListener> &listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = listeners_.find(listener);

        if (it != listeners_.end())
            listeners_.erase(it);
    }

private:
    /** @brief Mutex protecting the registry */
    mutable std::mutex mutex_;

    /** @brief Access points */
    std::map<std::string, std::shared_ptr<AccessPoint>> aps_;

    /** @brief Stations */
    StationMap stations_;

    /** @brief Default rate control algorithm */
    std::shared_ptr<RateControlAlgorithm> default_alg_;

    /** @brief Default rate control algorithm options */
    AlgorithmOptions default_opts_;

    /** @brief Listeners */
    std::set<std::shared_ptr<StationRegistryListener>> listeners_;

    /** @brief Apply a notification function to each listener */
    template <typename F>
    void notify(F&& f) const
    {
        std::set<std::shared_ptr<StationRegistryListener>> listeners;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            listeners = listeners_;
        }

        for (auto&& it : listeners)
            f(*it);
    }
};

#endif /* STATIONREGISTRY_HH_ */
