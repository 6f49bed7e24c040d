// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/pybind11.h>

#include "ControllerConfig.hh"
#include "Errors.hh"
#include "python/PyModules.hh"

void exportErrors(py::module &m)
{
    // Export enum ErrorCode to Python
    py::enum_<ErrorCode>(m, "ErrorCode")
        .value("MalformedField", ErrorCode::kMalformedField)
        .value("MalformedTimestamp", ErrorCode::kMalformedTimestamp)
        .value("MalformedAddress", ErrorCode::kMalformedAddress)
        .value("UnexpectedRecordType", ErrorCode::kUnexpectedRecordType)
        .value("FieldCountMismatch", ErrorCode::kFieldCountMismatch)
        .value("AlgorithmConfigureFailed", ErrorCode::kAlgorithmConfigureFailed)
        .value("AlgorithmRunExited", ErrorCode::kAlgorithmRunExited)
        .value("UnknownStation", ErrorCode::kUnknownStation)
        .value("UnknownAccessPoint", ErrorCode::kUnknownAccessPoint)
        .value("UnsupportedApiVersion", ErrorCode::kUnsupportedApiVersion)
        .value("StationMode", ErrorCode::kStationMode)
        .value("RoutingFailed", ErrorCode::kRoutingFailed)
        ;

    // Export exceptions. Translators registered later are tried first, so
    // subclasses follow their base.
    auto &base = py::register_exception<RatectlError>(m, "RatectlError");

    py::register_exception<DecodeError>(m, "DecodeError", base);
    py::register_exception<RateControlError>(m, "RateControlError", base);
    py::register_exception<StationModeError>(m, "StationModeError", base);
    py::register_exception<LookupError>(m, "LookupError", base);
}

void exportControllerConfig(py::module &m)
{
    // Export class ControllerConfig to Python
    py::class_<ControllerConfig, std::shared_ptr<ControllerConfig>>(m, "ControllerConfig")
        .def(py::init())
        .def_readwrite("debug",
            &ControllerConfig::debug,
            "bool: Print all log events to stderr")
        .def_readwrite("timestamp_format",
            &ControllerConfig::timestamp_format,
            "TimestampFormat: Default timestamp encoding for new access points")
        .def_readwrite("create_on_first_sight",
            &ControllerConfig::create_on_first_sight,
            "bool: Create a station the first time an event mentions it")
        .def_readwrite("pause_on_disassoc",
            &ControllerConfig::pause_on_disassoc,
            "bool: Default pause-on-disassociation flag for new stations")
        .def_readwrite("drop_stale_events",
            &ControllerConfig::drop_stale_events,
            "bool: Drop events older than a station's last-seen time")
        .def_property("cancel_timeout",
            [](const ControllerConfig &self) { return self.cancel_timeout.count(); },
            [](ControllerConfig &self, double t) { self.cancel_timeout = std::chrono::duration<double>(t); },
            "float: Seconds to wait for a cancelled algorithm to return")
        .def_property("configure_timeout",
            [](const ControllerConfig &self) { return self.configure_timeout.count(); },
            [](ControllerConfig &self, double t) { self.configure_timeout = std::chrono::duration<double>(t); },
            "float: Seconds to wait for an algorithm to configure")
        .def_readwrite("default_num_rates",
            &ControllerConfig::default_num_rates,
            "int: Number of rates of radios that advertise none")
        .def_readwrite("default_num_txpowers",
            &ControllerConfig::default_num_txpowers,
            "int: Number of TX power levels of radios that advertise none")
        ;

    // Export our global ControllerConfig
    m.attr("cfg") = py::cast(cfg, py::return_value_policy::reference);
}
