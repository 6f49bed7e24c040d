// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdint.h>
#include <string.h>

#include <H5Cpp.h>

#include "Clock.hh"
#include "Logger.hh"

std::shared_ptr<Logger> logger;

/** @brief File block size(-ish) */
constexpr size_t kBlockSize = 4*1024;

/** @brief Number of elements in the meta data cache */
constexpr int kMDCNumElements = 512;

/** @brief Number of elements in the raw data chunk cache */
constexpr size_t kRDCCNumElements = 512;

/** @brief Total size of the raw data chunk cache, in bytes */
constexpr size_t kRDCCNumBytes = 16*1024*kBlockSize;

/** @brief Preemption policy */
constexpr double kRDCCW0 = 0.0;

/** @brief Generic event */
struct EventEntry {
    /** @brief Event timestamp. */
    double timestamp;
    /** @brief Monotonic clock timestamp. */
    double mono_timestamp;
    /** @brief Event description. */
    const char *event;
};

/** @brief Log entry for transmission status reports */
struct TxStatusEntry {
    /** @brief Receive timestamp. */
    double timestamp;
    /** @brief Monotonic clock timestamp. */
    double mono_timestamp;
    /** @brief Device timestamp [ns]. */
    uint64_t device_timestamp;
    /** @brief Access point. */
    const char *ap;
    /** @brief Radio. */
    const char *phy;
    /** @brief Station address. */
    const char *mac;
    /** @brief Number of frames sent. */
    uint16_t num_frames;
    /** @brief Number of frames acknowledged. */
    uint16_t num_acked;
    /** @brief Was this a probe? */
    uint8_t probe;
    /** @brief Index of credited stage, or -1. */
    int8_t credited;
    /** @brief Rate of each stage. */
    int32_t rates[kMaxMrrStages];
    /** @brief Retry count of each stage. */
    uint32_t counts[kMaxMrrStages];
    /** @brief TX power of each stage. */
    int32_t txpowers[kMaxMrrStages];
};

/** @brief Log entry for kernel rate statistics reports */
struct RateStatsEntry {
    /** @brief Receive timestamp. */
    double timestamp;
    /** @brief Monotonic clock timestamp. */
    double mono_timestamp;
    /** @brief Device timestamp [ns]. */
    uint64_t device_timestamp;
    /** @brief Access point. */
    const char *ap;
    /** @brief Radio. */
    const char *phy;
    /** @brief Station address. */
    const char *mac;
    /** @brief Rate index. */
    int32_t rate;
    /** @brief Averaged success probability. */
    uint32_t avg_prob;
    /** @brief Averaged throughput. */
    uint32_t avg_tp;
    /** @brief Successes in current window. */
    uint32_t cur_success;
    /** @brief Attempts in current window. */
    uint32_t cur_attempts;
    /** @brief Cumulative successes. */
    uint64_t hist_success;
    /** @brief Cumulative attempts. */
    uint64_t hist_attempts;
};

/** @brief Log entry for commands */
struct CommandEntry {
    /** @brief Send timestamp. */
    double timestamp;
    /** @brief Monotonic clock timestamp. */
    double mono_timestamp;
    /** @brief Access point. */
    const char *ap;
    /** @brief Command line. */
    const char *command;
};

Logger::Logger(const WallClock::time_point& t_start,
               const MonoClock::time_point& mono_t_start)
  : is_open_(false)
  , t_start_(t_start)
  , mono_t_start_(mono_t_start)
  , sources_(0)
{
}

Logger::~Logger()
{
    close();
}

void Logger::open(const std::string& filename)
{
    // H5 type for strings
    H5::StrType h5_string(H5::PredType::C_S1, H5T_VARIABLE);

    // H5 type for MRR stage arrays
    hsize_t        stage_dims[] = { kMaxMrrStages };
    H5::ArrayType  h5_stage_ints(H5::PredType::NATIVE_INT32, 1, stage_dims);
    H5::ArrayType  h5_stage_uints(H5::PredType::NATIVE_UINT32, 1, stage_dims);

    // H5 type for events
    H5::CompType h5_event(sizeof(EventEntry));

    h5_event.insertMember("timestamp", HOFFSET(EventEntry, timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_event.insertMember("mono_timestamp", HOFFSET(EventEntry, mono_timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_event.insertMember("event", HOFFSET(EventEntry, event), h5_string);

    // H5 type for transmission status reports
    H5::CompType h5_txs(sizeof(TxStatusEntry));

    h5_txs.insertMember("timestamp", HOFFSET(TxStatusEntry, timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_txs.insertMember("mono_timestamp", HOFFSET(TxStatusEntry, mono_timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_txs.insertMember("device_timestamp", HOFFSET(TxStatusEntry, device_timestamp), H5::PredType::NATIVE_UINT64);
    h5_txs.insertMember("ap", HOFFSET(TxStatusEntry, ap), h5_string);
    h5_txs.insertMember("phy", HOFFSET(TxStatusEntry, phy), h5_string);
    h5_txs.insertMember("mac", HOFFSET(TxStatusEntry, mac), h5_string);
    h5_txs.insertMember("num_frames", HOFFSET(TxStatusEntry, num_frames), H5::PredType::NATIVE_UINT16);
    h5_txs.insertMember("num_acked", HOFFSET(TxStatusEntry, num_acked), H5::PredType::NATIVE_UINT16);
    h5_txs.insertMember("probe", HOFFSET(TxStatusEntry, probe), H5::PredType::NATIVE_UINT8);
    h5_txs.insertMember("credited", HOFFSET(TxStatusEntry, credited), H5::PredType::NATIVE_INT8);
    h5_txs.insertMember("rates", HOFFSET(TxStatusEntry, rates), h5_stage_ints);
    h5_txs.insertMember("counts", HOFFSET(TxStatusEntry, counts), h5_stage_uints);
    h5_txs.insertMember("txpowers", HOFFSET(TxStatusEntry, txpowers), h5_stage_ints);

    // H5 type for kernel rate statistics
    H5::CompType h5_stats(sizeof(RateStatsEntry));

    h5_stats.insertMember("timestamp", HOFFSET(RateStatsEntry, timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_stats.insertMember("mono_timestamp", HOFFSET(RateStatsEntry, mono_timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_stats.insertMember("device_timestamp", HOFFSET(RateStatsEntry, device_timestamp), H5::PredType::NATIVE_UINT64);
    h5_stats.insertMember("ap", HOFFSET(RateStatsEntry, ap), h5_string);
    h5_stats.insertMember("phy", HOFFSET(RateStatsEntry, phy), h5_string);
    h5_stats.insertMember("mac", HOFFSET(RateStatsEntry, mac), h5_string);
    h5_stats.insertMember("rate", HOFFSET(RateStatsEntry, rate), H5::PredType::NATIVE_INT32);
    h5_stats.insertMember("avg_prob", HOFFSET(RateStatsEntry, avg_prob), H5::PredType::NATIVE_UINT32);
    h5_stats.insertMember("avg_tp", HOFFSET(RateStatsEntry, avg_tp), H5::PredType::NATIVE_UINT32);
    h5_stats.insertMember("cur_success", HOFFSET(RateStatsEntry, cur_success), H5::PredType::NATIVE_UINT32);
    h5_stats.insertMember("cur_attempts", HOFFSET(RateStatsEntry, cur_attempts), H5::PredType::NATIVE_UINT32);
    h5_stats.insertMember("hist_success", HOFFSET(RateStatsEntry, hist_success), H5::PredType::NATIVE_UINT64);
    h5_stats.insertMember("hist_attempts", HOFFSET(RateStatsEntry, hist_attempts), H5::PredType::NATIVE_UINT64);

    // H5 type for commands
    H5::CompType h5_command(sizeof(CommandEntry));

    h5_command.insertMember("timestamp", HOFFSET(CommandEntry, timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_command.insertMember("mono_timestamp", HOFFSET(CommandEntry, mono_timestamp), H5::PredType::NATIVE_DOUBLE);
    h5_command.insertMember("ap", HOFFSET(CommandEntry, ap), h5_string);
    h5_command.insertMember("command", HOFFSET(CommandEntry, command), h5_string);

    // Open log file and set cache parameters
    H5::FileAccPropList acc_plist = H5::FileAccPropList::DEFAULT;

    acc_plist.setCache(kMDCNumElements,
                       kRDCCNumElements,
                       kRDCCNumBytes,
                       kRDCCW0);

    file_ = H5::H5File(filename, H5F_ACC_TRUNC, H5::FileCreatPropList::DEFAULT, acc_plist);

    // Create H5 data sets
    event_ = std::make_unique<ExtensibleDataSet>(file_, "event", h5_event);
    txs_ = std::make_unique<ExtensibleDataSet>(file_, "txs", h5_txs);
    stats_ = std::make_unique<ExtensibleDataSet>(file_, "stats", h5_stats);
    command_ = std::make_unique<ExtensibleDataSet>(file_, "command", h5_command);

    // Start worker thread
    worker_thread_ = std::thread(&Logger::worker, this);

    is_open_ = true;
}

void Logger::stop(void)
{
    log_q_.close();

    if (worker_thread_.joinable())
        worker_thread_.join();
}

void Logger::close(void)
{
    if (is_open_) {
        stop();
        event_.reset();
        txs_.reset();
        stats_.reset();
        command_.reset();
        file_.close();
        is_open_ = false;
    }
}

void Logger::setAttribute(const std::string& name, const std::string& val)
{
    H5::StrType   h5_type(H5::PredType::C_S1, H5T_VARIABLE);
    H5::DataSpace attr_space(H5S_SCALAR);
    H5::Attribute att = createOrOpenAttribute(name, h5_type, attr_space);

    att.write(h5_type, val);
}

void Logger::setAttribute(const std::string& name, uint8_t val)
{
    H5::IntType   h5_type(H5::PredType::NATIVE_UINT8);
    H5::DataSpace attr_space(H5S_SCALAR);
    H5::Attribute att = createOrOpenAttribute(name, h5_type, attr_space);

    att.write(h5_type, &val);
}

void Logger::setAttribute(const std::string& name, uint32_t val)
{
    H5::IntType   h5_type(H5::PredType::NATIVE_UINT32);
    H5::DataSpace attr_space(H5S_SCALAR);
    H5::Attribute att = createOrOpenAttribute(name, h5_type, attr_space);

    att.write(h5_type, &val);
}

void Logger::setAttribute(const std::string& name, int64_t val)
{
    H5::IntType   h5_type(H5::PredType::NATIVE_INT64);
    H5::DataSpace attr_space(H5S_SCALAR);
    H5::Attribute att = createOrOpenAttribute(name, h5_type, attr_space);

    att.write(h5_type, &val);
}

void Logger::setAttribute(const std::string& name, uint64_t val)
{
    H5::IntType   h5_type(H5::PredType::NATIVE_UINT64);
    H5::DataSpace attr_space(H5S_SCALAR);
    H5::Attribute att = createOrOpenAttribute(name, h5_type, attr_space);

    att.write(h5_type, &val);
}

void Logger::setAttribute(const std::string& name, double val)
{
    H5::FloatType h5_type(H5::PredType::NATIVE_DOUBLE);
    H5::DataSpace attr_space(H5S_SCALAR);
    H5::Attribute att = createOrOpenAttribute(name, h5_type, attr_space);

    att.write(h5_type, &val);
}

void Logger::worker(void)
{
    std::function<void()> entry;

    // Pending entries are drained after the queue is closed
    while (log_q_.pop(entry))
        entry();
}

H5::Attribute Logger::createOrOpenAttribute(const std::string &name,
                                            const H5::DataType &data_type,
                                            const H5::DataSpace &data_space)
{
    if (file_.attrExists(name))
        return file_.openAttribute(name);
    else
        return file_.createAttribute(name, data_type, data_space);
}

double Logger::wallTime(const MonoClock::time_point& t) const
{
    return std::chrono::duration<double>(t_start_.time_since_epoch() + (t - mono_t_start_)).count();
}

double Logger::monoTime(const MonoClock::time_point& t) const
{
    return sinceStart(t, mono_t_start_);
}

void Logger::logEvent_(const MonoClock::time_point& t,
                       const std::string& event)
{
    EventEntry entry;

    entry.timestamp = wallTime(t);
    entry.mono_timestamp = monoTime(t);
    entry.event = event.c_str();

    event_->write(&entry, 1);
}

void Logger::logTxStatus_(const MonoClock::time_point& t,
                          const std::string& ap,
                          const TxStatusEvent& ev)
{
    TxStatusEntry entry;
    std::string   mac = ev.mac.toString();

    entry.timestamp = wallTime(t);
    entry.mono_timestamp = monoTime(t);
    entry.device_timestamp = ev.timestamp;
    entry.ap = ap.c_str();
    entry.phy = ev.phy.c_str();
    entry.mac = mac.c_str();
    entry.num_frames = ev.num_frames;
    entry.num_acked = ev.num_acked;
    entry.probe = ev.probe;
    entry.credited = ev.mrr.credited ? static_cast<int8_t>(*ev.mrr.credited) : -1;

    for (unsigned i = 0; i < kMaxMrrStages; ++i) {
        entry.rates[i] = ev.mrr.stages[i].rate;
        entry.counts[i] = ev.mrr.stages[i].count;
        entry.txpowers[i] = ev.mrr.stages[i].txpower;
    }

    txs_->write(&entry, 1);
}

void Logger::logRateStats_(const MonoClock::time_point& t,
                           const std::string& ap,
                           const RateStatsEvent& ev)
{
    RateStatsEntry entry;
    std::string    mac = ev.mac.toString();

    entry.timestamp = wallTime(t);
    entry.mono_timestamp = monoTime(t);
    entry.device_timestamp = ev.timestamp;
    entry.ap = ap.c_str();
    entry.phy = ev.phy.c_str();
    entry.mac = mac.c_str();
    entry.rate = ev.rate;
    entry.avg_prob = ev.avg_prob;
    entry.avg_tp = ev.avg_tp;
    entry.cur_success = ev.cur_success;
    entry.cur_attempts = ev.cur_attempts;
    entry.hist_success = ev.hist_success;
    entry.hist_attempts = ev.hist_attempts;

    stats_->write(&entry, 1);
}

void Logger::logCommand_(const MonoClock::time_point& t,
                         const std::string& ap,
                         const std::string& command)
{
    CommandEntry entry;

    entry.timestamp = wallTime(t);
    entry.mono_timestamp = monoTime(t);
    entry.ap = ap.c_str();
    entry.command = command.c_str();

    command_->write(&entry, 1);
}
