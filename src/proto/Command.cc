// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdexcept>
#include <type_traits>

#include "proto/Command.hh"
#include "util/ssprintf.hh"

namespace cmd {

template <class T>
static std::string joinHex(const std::vector<T> &xs, const char *what)
{
    std::string s;

    for (size_t i = 0; i < xs.size(); ++i) {
        if constexpr (std::is_signed<T>::value) {
            if (xs[i] < 0)
                throw std::invalid_argument(std::string("Negative ") + what);
        }

        if (i != 0)
            s += ',';

        s += ssprintf("%x", static_cast<unsigned>(xs[i]));
    }

    return s;
}

static void checkTableSize(size_t n, const char *what)
{
    if (n == 0)
        throw std::invalid_argument(std::string("Empty ") + what + " table");

    if (n > kMaxMrrStages)
        throw std::invalid_argument(ssprintf("%s table has %lu entries but at most %u are allowed",
                                             what,
                                             (unsigned long) n,
                                             kMaxMrrStages));
}

static void checkSameSize(size_t n, size_t m, const char *what)
{
    if (n != m)
        throw std::invalid_argument(ssprintf("Rate table has %lu entries but %s table has %lu",
                                             (unsigned long) n,
                                             what,
                                             (unsigned long) m));
}

std::string rcMode(const std::string &phy, ControlMode mode)
{
    return phy + ";" + controlMode2string(mode);
}

std::string tpcMode(const std::string &phy, ControlMode mode)
{
    return phy + ";" + controlMode2string(mode) + "_tpc";
}

std::string setRates(const std::string &phy,
                     const MacAddr &mac,
                     const std::vector<int> &rates,
                     const std::vector<unsigned> &counts)
{
    checkTableSize(rates.size(), "rate");
    checkSameSize(rates.size(), counts.size(), "count");

    return phy + ";rates;" + mac.toString() + ";" +
           joinHex(rates, "rate") + ";" +
           joinHex(counts, "count");
}

std::string setPower(const std::string &phy,
                     const MacAddr &mac,
                     const std::vector<int> &txpowers)
{
    checkTableSize(txpowers.size(), "power");

    return phy + ";power;" + mac.toString() + ";" + joinHex(txpowers, "txpower");
}

std::string setRatesPower(const std::string &phy,
                          const MacAddr &mac,
                          const std::vector<int> &rates,
                          const std::vector<unsigned> &counts,
                          const std::vector<int> &txpowers)
{
    checkTableSize(rates.size(), "rate");
    checkSameSize(rates.size(), counts.size(), "count");
    checkSameSize(rates.size(), txpowers.size(), "power");

    return phy + ";rates_power;" + mac.toString() + ";" +
           joinHex(rates, "rate") + ";" +
           joinHex(counts, "count") + ";" +
           joinHex(txpowers, "txpower");
}

std::string probe(const std::string &phy,
                  const MacAddr &mac,
                  int rate,
                  std::optional<int> txpower)
{
    if (rate < 0)
        throw std::invalid_argument("Negative rate");

    std::string s = phy + ";probe;" + mac.toString() + ";" + ssprintf("%x", static_cast<unsigned>(rate));

    if (txpower) {
        if (*txpower < 0)
            throw std::invalid_argument("Negative txpower");

        s += ssprintf(";%x", static_cast<unsigned>(*txpower));
    }

    return s;
}

std::string resetStats(const std::string &phy, const MacAddr &mac)
{
    return phy + ";reset_stats;" + mac.toString();
}

static std::string eventsCommand(const std::string &phy,
                                 const char *verb,
                                 const std::vector<std::string> &events)
{
    std::string s = phy + ";" + verb;

    for (const auto &ev : events)
        s += ";" + ev;

    return s;
}

std::string startEvents(const std::string &phy,
                        const std::vector<std::string> &events)
{
    return eventsCommand(phy, "start", events);
}

std::string stopEvents(const std::string &phy,
                       const std::vector<std::string> &events)
{
    return eventsCommand(phy, "stop", events);
}

}
