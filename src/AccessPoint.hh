// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef ACCESSPOINT_HH_
#define ACCESSPOINT_HH_

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "net/Transport.hh"
#include "proto/LineDecoder.hh"

/** @brief Capabilities of one radio of an access point */
struct RadioInfo {
    /** @brief Number of rate indices */
    unsigned num_rates;

    /** @brief Number of TX power levels */
    unsigned num_txpowers;
};

/** @brief An access point and the connection it is reached over */
class AccessPoint {
public:
    AccessPoint(const std::string &name,
                std::shared_ptr<Transport> transport,
                TimestampFormat fmt);

    AccessPoint(const std::string &name,
                std::shared_ptr<Transport> transport);

    ~AccessPoint() = default;

    AccessPoint() = delete;
    AccessPoint(const AccessPoint&) = delete;
    AccessPoint(AccessPoint&&) = delete;

    AccessPoint& operator=(const AccessPoint&) = delete;
    AccessPoint& operator=(AccessPoint&&) = delete;

    /** @brief Get access point name */
    const std::string &getName(void) const
    {
        return name_;
    }

    /** @brief Get a decoder for lines received from this access point */
    LineDecoder getDecoder(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return LineDecoder(fmt_);
    }

    /** @brief Get timestamp format */
    TimestampFormat getTimestampFormat(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return fmt_;
    }

    /** @brief Set timestamp format */
    void setTimestampFormat(TimestampFormat fmt)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        fmt_ = fmt;
    }

    /** @brief Record the capabilities of a radio */
    void addRadio(const std::string &phy,
                  unsigned num_rates,
                  unsigned num_txpowers);

    /** @brief Get the capabilities of a radio.
     * Radios that were never added get the configured defaults.
     */
    RadioInfo getRadio(const std::string &phy) const;

    /** @brief Get the names of all added radios */
    std::vector<std::string> getRadios(void) const;

    /** @brief Send a command line to the access point.
     * Commands are serialized in the order they are issued.
     * @throw std::runtime_error if the transport fails
     */
    void send(const std::string &line);

    /** @brief Get the most recent command */
    std::optional<std::string> getLastCommand(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return last_cmd_;
    }

    /** @brief Enable event streams of a radio */
    void enableEvents(const std::string &phy,
                      const std::vector<std::string> &events);

    /** @brief Disable event streams of a radio */
    void disableEvents(const std::string &phy,
                       const std::vector<std::string> &events);

    /** @brief Record the API version the access point announced */
    void setApiVersion(unsigned major, unsigned minor)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        api_version_ = std::make_pair(major, minor);
    }

    /** @brief Get the API version the access point announced */
    std::optional<std::pair<unsigned, unsigned>> getApiVersion(void) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        return api_version_;
    }

    /** @brief Report an error the access point sent us */
    void handleError(const std::string &msg);

private:
    /** @brief Access point name */
    const std::string name_;

    /** @brief Connection to the access point */
    std::shared_ptr<Transport> transport_;

    /** @brief Mutex protecting access point state */
    mutable std::mutex mutex_;

    /** @brief Mutex serializing commands */
    std::mutex send_mutex_;

    /** @brief Timestamp format */
    TimestampFormat fmt_;

    /** @brief Radios */
    std::map<std::string, RadioInfo> radios_;

    /** @brief Most recent command */
    std::optional<std::string> last_cmd_;

    /** @brief Announced API version */
    std::optional<std::pair<unsigned, unsigned>> api_version_;
};

#endif /* ACCESSPOINT_HH_ */
