// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PROTO_COMMAND_HH_
#define PROTO_COMMAND_HH_

#include <optional>
#include <string>
#include <vector>

#include "proto/Events.hh"
#include "util/net.hh"

/** @brief Construct outbound command lines.
 * Lines carry no trailing newline; the transport adds framing. All numeric
 * arguments are formatted in hexadecimal.
 */
namespace cmd {

/** @brief Set rate control mode of a radio */
std::string rcMode(const std::string &phy, ControlMode mode);

/** @brief Set power control mode of a radio */
std::string tpcMode(const std::string &phy, ControlMode mode);

/** @brief Install a rate table for a station.
 * @throw std::invalid_argument if the lists are empty, of unequal length,
 * longer than the number of MRR stages, or contain negative values.
 */
std::string setRates(const std::string &phy,
                     const MacAddr &mac,
                     const std::vector<int> &rates,
                     const std::vector<unsigned> &counts);

/** @brief Install a power table for a station. */
std::string setPower(const std::string &phy,
                     const MacAddr &mac,
                     const std::vector<int> &txpowers);

/** @brief Install a rate and power table for a station. */
std::string setRatesPower(const std::string &phy,
                          const MacAddr &mac,
                          const std::vector<int> &rates,
                          const std::vector<unsigned> &counts,
                          const std::vector<int> &txpowers);

/** @brief Probe a rate, optionally at a given power */
std::string probe(const std::string &phy,
                  const MacAddr &mac,
                  int rate,
                  std::optional<int> txpower = std::nullopt);

/** @brief Reset the kernel's statistics for a station */
std::string resetStats(const std::string &phy, const MacAddr &mac);

/** @brief Enable event streams of a radio */
std::string startEvents(const std::string &phy,
                        const std::vector<std::string> &events);

/** @brief Disable event streams of a radio */
std::string stopEvents(const std::string &phy,
                       const std::vector<std::string> &events);

}

#endif /* PROTO_COMMAND_HH_ */
