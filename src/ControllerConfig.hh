// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef CONTROLLERCONFIG_H_
#define CONTROLLERCONFIG_H_

#include <chrono>

#include "proto/Events.hh"

class ControllerConfig;

/** @brief The global controller config. */
extern ControllerConfig cfg;

class ControllerConfig {
public:
    ControllerConfig();
    ControllerConfig(const ControllerConfig&) = default;
    ControllerConfig(ControllerConfig&&) = default;

    ~ControllerConfig() = default;

    ControllerConfig& operator=(const ControllerConfig&) = default;
    ControllerConfig& operator=(ControllerConfig&&) = default;

    /** @brief Print log events to stderr regardless of print level */
    bool debug;

    /** @brief Default timestamp encoding for new access points */
    TimestampFormat timestamp_format;

    /** @brief Create a station the first time an event mentions it */
    bool create_on_first_sight;

    /** @brief Default pause-on-disassociation flag for new stations */
    bool pause_on_disassoc;

    /** @brief Drop per-station events older than the station's last-seen time */
    bool drop_stale_events;

    /** @brief How long to wait for a cancelled algorithm to return */
    std::chrono::duration<double> cancel_timeout;

    /** @brief How long to wait for an algorithm's configure hook when attaching it */
    std::chrono::duration<double> configure_timeout;

    /** @brief Number of rates used when a radio does not advertise any */
    unsigned default_num_rates;

    /** @brief Number of TX power levels used when a radio does not advertise any */
    unsigned default_num_txpowers;
};

#endif /* CONTROLLERCONFIG_H_ */
