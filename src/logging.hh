// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <stdarg.h>

#include <string>

#include "Clock.hh"
#include "ControllerConfig.hh"

using loglevel = unsigned;

const loglevel LOGCRITICAL = 50;
const loglevel LOGERROR = 40;
const loglevel LOGWARNING = 30;
const loglevel LOGINFO = 20;
const loglevel LOGDEBUG = 10;
const loglevel LOGNOTSET = 0;

/** @brief Event categories */
enum EventCategory {
    kEventSystem = 0,
    kEventProto,
    kEventStation,
    kEventRC,
    kEventNet,
    kNumEvents
};

/** @brief Event category log levels */
extern loglevel loglevels[kNumEvents];

/** @brief Event category log print levels */
extern loglevel printlevels[kNumEvents];

/** @brief Return the string name of an event category */
std::string eventCategory2string(EventCategory cat);

/** @brief Return the named event category*/
EventCategory string2EventCategory(const std::string &s);

/** @brief Return true if logging is enabled for level */
bool isLogLevelEnabled(EventCategory, loglevel);

/** @brief Set log level */
void setLogLevel(EventCategory, loglevel);

/** @brief Return true if printing is enabled for level */
bool isPrintLogLevelEnabled(EventCategory, loglevel);

/** @brief Set printing log level */
void setPrintLogLevel(EventCategory, loglevel);

/** @brief Log an event */
void vlogEvent(const MonoClock::time_point& t,
               EventCategory cat,
               loglevel lvl,
               const char *fmt,
               va_list ap);

void logEvent(EventCategory cat,
              loglevel lvl,
              const char *fmt, ...)
#if !defined(DOXYGEN)
__attribute__((format(printf, 3, 4)))
#endif
;

/** @brief Log an event using current time */
inline void logEvent(EventCategory cat,
                     loglevel lvl,
                     const char *fmt, ...)
{
    if (cfg.debug || lvl >= loglevels[cat] || lvl >= printlevels[cat]) {
        va_list ap;

        va_start(ap, fmt);
        vlogEvent(MonoClock::now(), cat, lvl, fmt, ap);
        va_end(ap);
    }
}

#define logSystem(lvl, ...)  logEvent(kEventSystem, lvl, "SYSTEM: " __VA_ARGS__)
#define logProto(lvl, ...)   logEvent(kEventProto, lvl, "PROTO: " __VA_ARGS__)
#define logStation(lvl, ...) logEvent(kEventStation, lvl, "STATION: " __VA_ARGS__)
#define logRC(lvl, ...)      logEvent(kEventRC, lvl, "RC: " __VA_ARGS__)
#define logNet(lvl, ...)     logEvent(kEventNet, lvl, "NET: " __VA_ARGS__)

#endif /* LOGGING_HH_ */
