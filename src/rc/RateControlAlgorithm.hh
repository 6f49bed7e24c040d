// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef RC_RATECONTROLALGORITHM_HH_
#define RC_RATECONTROLALGORITHM_HH_

#include <map>
#include <memory>
#include <string>

#include "rc/CancellationToken.hh"

class Station;

/** @brief Opaque per-station state produced by an algorithm's configure hook */
class AlgorithmContext {
public:
    virtual ~AlgorithmContext() = default;
};

/** @brief Algorithm options */
using AlgorithmOptions = std::map<std::string, std::string>;

/** @brief A pluggable rate control algorithm */
/** configure and run are required. pause and resume form an optional pair; an
 * algorithm that provides them reports so via canPause. Without them, a paused
 * station is resumed by configuring and running the algorithm from scratch.
 */
class RateControlAlgorithm {
public:
    RateControlAlgorithm() = default;

    virtual ~RateControlAlgorithm() = default;

    /** @brief Algorithm name */
    virtual std::string getName(void) const = 0;

    /** @brief Configure a station for this algorithm.
     * Expected to return promptly. Failure is reported by throwing.
     * @return Context handed to the other hooks
     */
    virtual std::shared_ptr<AlgorithmContext> configure(const std::shared_ptr<Station> &sta,
                                                        const AlgorithmOptions &opts) = 0;

    /** @brief Run the algorithm.
     * Expected to run until the token is cancelled. Returning earlier stops
     * rate control for the station.
     */
    virtual void run(const std::shared_ptr<AlgorithmContext> &ctx,
                     CancellationToken &token) = 0;

    /** @brief Does the algorithm provide pause and resume hooks? */
    virtual bool canPause(void) const
    {
        return false;
    }

    /** @brief Pause hook, called after run has returned due to a pause */
    virtual void pause(const std::shared_ptr<AlgorithmContext> &ctx)
    {
    }

    /** @brief Resume hook, called before run is restarted */
    virtual void resume(const std::shared_ptr<AlgorithmContext> &ctx)
    {
    }
};

#endif /* RC_RATECONTROLALGORITHM_HH_ */
