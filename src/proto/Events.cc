// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "proto/Events.hh"

/** @brief Number of rates actually used in a rate group */
constexpr int kMaxGroupRates = 10;

const char *controlMode2string(ControlMode mode)
{
    return mode == ControlMode::kManual ? "manual" : "auto";
}

std::optional<ControlMode> string2ControlMode(const std::string &s)
{
    if (s == "manual" || s == "1")
        return ControlMode::kManual;
    else if (s == "auto" || s == "0")
        return ControlMode::kAuto;
    else
        return std::nullopt;
}

std::vector<int> StationAddEvent::supportedRates(void) const
{
    std::vector<int> rates;

    for (size_t grp = 0; grp < group_masks.size(); ++grp) {
        for (int ofs = 0; ofs < kMaxGroupRates; ++ofs) {
            if (group_masks[grp] & (1 << ofs))
                rates.push_back(static_cast<int>(grp*kRatesPerGroup) + ofs);
        }
    }

    return rates;
}

const char *eventName(const Event &ev)
{
    static const char *names[] = {
        "txs",
        "stats",
        "rxs",
        "sta;add",
        "sta;remove",
        "mode",
        "#error",
        "orca_version"
    };

    return names[ev.index()];
}
