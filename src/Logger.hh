// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef LOGGER_H_
#define LOGGER_H_

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <H5Cpp.h>

#include "Clock.hh"
#include "ExtensibleDataSet.hh"
#include "SafeQueue.hh"
#include "proto/Events.hh"

class Logger;

/** @brief The global logger. */
extern std::shared_ptr<Logger> logger;

/** @brief Write controller traces to an HDF5 file */
/** Entries are queued by the caller and written by a worker thread, so logging
 * never blocks on file I/O.
 */
class Logger {
public:
    /** @brief Logging sources */
    enum Source {
        kEvents = 0,
        kTxStatus,
        kRateStats,
        kCommands
    };

    Logger(const WallClock::time_point &t_start,
           const MonoClock::time_point &mono_t_start);
    ~Logger();

    Logger() = delete;
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open(const std::string& filename);
    void stop(void);
    void close(void);

    /** @brief Is the log file open? */
    bool isOpen(void) const
    {
        return is_open_;
    }

    inline bool getCollectSource(Source src) const
    {
        return sources_.load(std::memory_order_relaxed) & (1 << src);
    }

    void setCollectSource(Source src, bool collect)
    {
        if (collect)
            sources_.fetch_or(1 << src, std::memory_order_relaxed);
        else
            sources_.fetch_and(~(1 << src), std::memory_order_relaxed);
    }

    void setAttribute(const std::string& name, const std::string& val);
    void setAttribute(const std::string& name, uint8_t val);
    void setAttribute(const std::string& name, uint32_t val);
    void setAttribute(const std::string& name, int64_t val);
    void setAttribute(const std::string& name, uint64_t val);
    void setAttribute(const std::string& name, double val);

    void logEvent(const MonoClock::time_point& t,
                  std::string event)
    {
        if (getCollectSource(kEvents))
            log_q_.push([=, event = std::move(event)](){ logEvent_(t, event); });
    }

    void logTxStatus(const MonoClock::time_point& t,
                     const std::string& ap,
                     const TxStatusEvent& ev)
    {
        if (getCollectSource(kTxStatus))
            log_q_.push([=](){ logTxStatus_(t, ap, ev); });
    }

    void logRateStats(const MonoClock::time_point& t,
                      const std::string& ap,
                      const RateStatsEvent& ev)
    {
        if (getCollectSource(kRateStats))
            log_q_.push([=](){ logRateStats_(t, ap, ev); });
    }

    void logCommand(const MonoClock::time_point& t,
                    const std::string& ap,
                    const std::string& command)
    {
        if (getCollectSource(kCommands))
            log_q_.push([=](){ logCommand_(t, ap, command); });
    }

private:
    bool is_open_;
    H5::H5File file_;
    std::unique_ptr<ExtensibleDataSet> event_;
    std::unique_ptr<ExtensibleDataSet> txs_;
    std::unique_ptr<ExtensibleDataSet> stats_;
    std::unique_ptr<ExtensibleDataSet> command_;
    WallClock::time_point t_start_;
    MonoClock::time_point mono_t_start_;

    /** @brief Data sources we collect. */
    std::atomic<uint32_t> sources_;

    /** @brief Pending log entries. */
    SafeQueue<std::function<void(void)>> log_q_;

    /** @brief Log worker thread. */
    std::thread worker_thread_;

    /** @brief Log worker. */
    void worker(void);

    H5::Attribute createOrOpenAttribute(const std::string &name,
                                        const H5::DataType &data_type,
                                        const H5::DataSpace &data_space);

    /** @brief Wall clock time of a monotonic time point [sec] */
    double wallTime(const MonoClock::time_point& t) const;

    /** @brief Monotonic time since start [sec] */
    double monoTime(const MonoClock::time_point& t) const;

    void logEvent_(const MonoClock::time_point& t,
                   const std::string& event);

    void logTxStatus_(const MonoClock::time_point& t,
                      const std::string& ap,
                      const TxStatusEvent& ev);

    void logRateStats_(const MonoClock::time_point& t,
                       const std::string& ap,
                       const RateStatsEvent& ev);

    void logCommand_(const MonoClock::time_point& t,
                     const std::string& ap,
                     const std::string& command);
};

#endif /* LOGGER_H_ */
