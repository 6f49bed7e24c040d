// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef DISPATCHER_HH_
#define DISPATCHER_HH_

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "Errors.hh"
#include "StationRegistry.hh"
#include "proto/Events.hh"

/** @brief The outcome of processing one line */
struct DispatchResult {
    /** @brief The decoded event, if the line could be decoded */
    std::optional<Event> event;

    /** @brief The error that occurred, if any */
    std::optional<ErrorCode> error;

    /** @brief Error description */
    std::string message;

    /** @brief Return true if the line was decoded and routed without error */
    bool ok(void) const
    {
        return event && !error;
    }
};

/** @brief A listener for dispatched events */
class DispatcherListener
{
public:
    DispatcherListener() = default;

    virtual ~DispatcherListener() = default;

    /** @brief Called for every successfully decoded event
     * @param ap The access point the event came from
     * @param ev The event
     */
    virtual void eventDecoded(const std::string &ap, const Event &ev)
    {
    }

    /** @brief Called for every line that could not be decoded
     * @param ap The access point the line came from
     * @param line The line
     * @param err The decode error
     */
    virtual void decodeFailed(const std::string &ap,
                              const std::string &line,
                              ErrorCode err)
    {
    }
};

/** @brief Decode lines and route the resulting events to stations */
/** Processing a line never throws and never blocks on a rate control
 * algorithm. Lines from one access point must be processed in the order they
 * were received.
 */
class Dispatcher
{
public:
    explicit Dispatcher(std::shared_ptr<StationRegistry> registry);

    ~Dispatcher() = default;

    Dispatcher() = delete;
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;

    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    /** @brief Get the station registry */
    const std::shared_ptr<StationRegistry> &getRegistry(void) const
    {
        return registry_;
    }

    /** @brief Process one line received from an access point */
    DispatchResult process(const std::string &ap_name, std::string_view line);

    /** @brief Add a listener
     * @param listener The listener to add
     */
    void addListener(const std::shared_ptr<DispatcherListener> &listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        listeners_.insert(listener);
    }

    /** @brief Remove a listener
     * @param listener The listener to remove
     */
    void removeListener(const std::shared_ptr<DispatcherListener> &listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = listeners_.find(listener);

        if (it != listeners_.end())
            listeners_.erase(it);
    }

private:
    /** @brief Station registry */
    std::shared_ptr<StationRegistry> registry_;

    /** @brief Mutex protecting listeners */
    mutable std::mutex mutex_;

    /** @brief Listeners */
    std::set<std::shared_ptr<DispatcherListener>> listeners_;

    /** @brief Route an event to its station */
    void route(const std::shared_ptr<AccessPoint> &ap,
               const Event &ev,
               DispatchResult &result);

    /** @brief Find the station an event is for.
     * @param create Create the station if it is not known
     * @return The station, or nullptr if it is not known
     */
    std::shared_ptr<Station> findStation(const std::shared_ptr<AccessPoint> &ap,
                                         const std::string &phy,
                                         const MacAddr &mac,
                                         bool create);

    /** @brief Apply a notification function to each listener */
    template <typename F>
    void notify(F&& f) const
    {
        std::set<std::shared_ptr<DispatcherListener>> listeners;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            listeners = listeners_;
        }

        for (auto&& it : listeners)
            f(*it);
    }
};

#endif /* DISPATCHER_HH_ */
