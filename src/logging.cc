// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdio.h>

#include <stdexcept>

#include "ControllerConfig.hh"
#include "Logger.hh"
#include "logging.hh"
#include "util/ssprintf.hh"

loglevel loglevels[kNumEvents] = { LOGINFO, LOGINFO, LOGINFO, LOGINFO, LOGINFO };

loglevel printlevels[kNumEvents] = { LOGWARNING, LOGWARNING, LOGWARNING, LOGWARNING, LOGWARNING };

static const char *event_category_names[kNumEvents] = {
    "system",
    "proto",
    "station",
    "rc",
    "net"
};

std::string eventCategory2string(EventCategory cat)
{
    if (cat < 0 || cat >= kNumEvents)
        throw std::out_of_range("Illegal event category");

    return event_category_names[cat];
}

EventCategory string2EventCategory(const std::string &s)
{
    for (unsigned i = 0; i < kNumEvents; ++i) {
        if (s == event_category_names[i])
            return static_cast<EventCategory>(i);
    }

    throw std::out_of_range("Illegal event category: " + s);
}

bool isLogLevelEnabled(EventCategory cat, loglevel lvl)
{
    return lvl >= loglevels[cat];
}

void setLogLevel(EventCategory cat, loglevel lvl)
{
    loglevels[cat] = lvl;
}

bool isPrintLogLevelEnabled(EventCategory cat, loglevel lvl)
{
    return lvl >= printlevels[cat];
}

void setPrintLogLevel(EventCategory cat, loglevel lvl)
{
    printlevels[cat] = lvl;
}

void vlogEvent(const MonoClock::time_point& t,
               EventCategory cat,
               loglevel lvl,
               const char *fmt,
               va_list ap)
{
    std::shared_ptr<Logger> l = logger;
    bool                    print = cfg.debug || lvl >= printlevels[cat];
    bool                    collect = l && lvl >= loglevels[cat] && l->getCollectSource(Logger::kEvents);

    if (!print && !collect)
        return;

    std::string msg = vssprintf(fmt, ap);

    if (print) {
        fputs(msg.c_str(), stderr);
        putc('\n', stderr);
    }

    if (collect)
        l->logEvent(t, std::move(msg));
}
