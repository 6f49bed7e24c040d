// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "AccessPoint.hh"
#include "ControllerConfig.hh"
#include "Logger.hh"
#include "logging.hh"
#include "proto/Command.hh"

AccessPoint::AccessPoint(const std::string &name,
                         std::shared_ptr<Transport> transport,
                         TimestampFormat fmt)
  : name_(name)
  , transport_(transport)
  , fmt_(fmt)
{
}

AccessPoint::AccessPoint(const std::string &name,
                         std::shared_ptr<Transport> transport)
  : AccessPoint(name, transport, cfg.timestamp_format)
{
}

void AccessPoint::addRadio(const std::string &phy,
                           unsigned num_rates,
                           unsigned num_txpowers)
{
    std::lock_guard<std::mutex> lock(mutex_);

    radios_[phy] = RadioInfo{ num_rates, num_txpowers };
}

RadioInfo AccessPoint::getRadio(const std::string &phy) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = radios_.find(phy);

    if (it != radios_.end())
        return it->second;
    else
        return RadioInfo{ cfg.default_num_rates, cfg.default_num_txpowers };
}

std::vector<std::string> AccessPoint::getRadios(void) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    phys;

    for (auto it = radios_.begin(); it != radios_.end(); ++it)
        phys.push_back(it->first);

    return phys;
}

void AccessPoint::send(const std::string &line)
{
    std::lock_guard<std::mutex> send_lock(send_mutex_);

    logNet(LOGDEBUG, "%s: send %s", name_.c_str(), line.c_str());

    transport_->send(line);

    {
        std::lock_guard<std::mutex> lock(mutex_);

        last_cmd_ = line;
    }

    if (logger)
        logger->logCommand(MonoClock::now(), name_, line);
}

void AccessPoint::enableEvents(const std::string &phy,
                               const std::vector<std::string> &events)
{
    send(cmd::startEvents(phy, events));
}

void AccessPoint::disableEvents(const std::string &phy,
                                const std::vector<std::string> &events)
{
    send(cmd::stopEvents(phy, events));
}

void AccessPoint::handleError(const std::string &msg)
{
    std::optional<std::string> last = getLastCommand();

    logNet(LOGERROR, "%s: device error: %s (last command: %s)",
        name_.c_str(),
        msg.c_str(),
        last ? last->c_str() : "none");
}
