// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "logging.hh"
#include "Clock.hh"
#include "Logger.hh"
#include "python/PyModules.hh"

std::shared_ptr<Logger> mkLogger(const std::string& path)
{
    auto t_start = WallClock::now();
    auto log = std::make_shared<Logger>(t_start, MonoClock::now());

    log->open(path);
    log->setAttribute("start", (int64_t) std::chrono::duration_cast<std::chrono::seconds>(t_start.time_since_epoch()).count());

    return log;
}

void addLoggerSource(py::class_<Logger, std::shared_ptr<Logger>>& cls, const std::string &name, Logger::Source src)
{
    cls.def_property(name.c_str(),
        [src](std::shared_ptr<Logger> log) { return log->getCollectSource(src); },
        [src](std::shared_ptr<Logger> log, bool collect) { log->setCollectSource(src, collect); });
}

void exportLogger(py::module &m)
{
    // Create enum type EventCategory for logger categories
    py::enum_<EventCategory> event_cat(m, "EventCategory");

    event_cat.def(py::init([](std::string value) -> EventCategory {
            return string2EventCategory(value);
        }));

    py::implicitly_convertible<py::str, EventCategory>();

    for (unsigned i = 0; i < kNumEvents; ++i) {
        EventCategory cat = static_cast<EventCategory>(i);

        event_cat.value(eventCategory2string(cat).c_str(), cat);
    }

    event_cat.export_values();

    // Export log levels
    m.attr("CRITICAL") = LOGCRITICAL;
    m.attr("ERROR") = LOGERROR;
    m.attr("WARNING") = LOGWARNING;
    m.attr("INFO") = LOGINFO;
    m.attr("DEBUG") = LOGDEBUG;
    m.attr("NOTSET") = LOGNOTSET;

    // Export log level functions
    m.def("isLogLevelEnabled",
        &isLogLevelEnabled,
        "Return True if log level is enabled");

    m.def("setLogLevel",
        &setLogLevel,
        "Set log level");

    m.def("isPrintLogLevelEnabled",
        &isPrintLogLevelEnabled,
        "Return True if printing log level is enabled");

    m.def("setPrintLogLevel",
        &setPrintLogLevel,
        "Set printing log level");

    m.def("logEvent",
        [](EventCategory cat, loglevel lvl, const std::string &msg)
        {
            logEvent(cat, lvl, "%s", msg.c_str());
        },
        "Log an event");

    // Export class Logger to Python
    py::class_<Logger, std::shared_ptr<Logger>> loggerCls(m, "Logger");

    loggerCls
        .def_property_static("singleton",
            [](py::object) { return logger; },
            [](py::object, std::shared_ptr<Logger> log) { return logger = log; })
        .def(py::init(&mkLogger))
        .def_property_readonly("is_open",
            &Logger::isOpen,
            "bool: True if the log file is open")
        .def("close",
            &Logger::close,
            py::call_guard<py::gil_scoped_release>(),
            "Flush pending entries and close the log file")
        .def("setAttribute", py::overload_cast<const std::string&, const std::string&>(&Logger::setAttribute))
        .def("setAttribute", py::overload_cast<const std::string&, uint8_t>(&Logger::setAttribute))
        .def("setAttribute", py::overload_cast<const std::string&, uint32_t>(&Logger::setAttribute))
        .def("setAttribute", py::overload_cast<const std::string&, int64_t>(&Logger::setAttribute))
        .def("setAttribute", py::overload_cast<const std::string&, uint64_t>(&Logger::setAttribute))
        .def("setAttribute", py::overload_cast<const std::string&, double>(&Logger::setAttribute))
        .def("logEvent",
            [](Logger &self, const std::string &msg)
            {
                return self.logEvent(MonoClock::now(), msg);
            },
            "Log an event")
        .def("logCommand",
            [](Logger &self, const std::string &ap, const std::string &command)
            {
                return self.logCommand(MonoClock::now(), ap, command);
            },
            "Log a command")
        ;

    addLoggerSource(loggerCls, "log_events", Logger::kEvents);
    addLoggerSource(loggerCls, "log_txs", Logger::kTxStatus);
    addLoggerSource(loggerCls, "log_stats", Logger::kRateStats);
    addLoggerSource(loggerCls, "log_commands", Logger::kCommands);
}
