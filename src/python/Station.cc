// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "AccessPoint.hh"
#include "Station.hh"
#include "net/Transport.hh"
#include "stats/RateStatsTable.hh"
#include "python/PyModules.hh"

/* Trampoline class for Transport */
class PyTransport : public Transport {
public:
    /* Inherit the constructors */
    using Transport::Transport;

    void send(const std::string &line) override
    {
        PYBIND11_OVERLOAD_PURE(
            void,      /* Return type */
            Transport, /* Parent class */
            send,      /* Name of function in C++ (must match Python name) */
            line       /* Argument(s) */
        );
    }
};

void exportRateStats(py::module &m)
{
    // Export class RateStats to Python
    py::class_<RateStats>(m, "RateStats")
        .def(py::init<>())
        .def_readonly("attempts",
            &RateStats::attempts,
            "int: Cumulative attempts")
        .def_readonly("successes",
            &RateStats::successes,
            "int: Cumulative successes")
        .def_readonly("timestamp",
            &RateStats::timestamp,
            "int: Timestamp of the most recent update (ns)")
        .def("__repr__", [](const RateStats &self) {
            return py::str("RateStats(attempts={}, successes={}, timestamp={})")
                .format(self.attempts, self.successes, self.timestamp);
         })
        ;

    // Export class RateStatsTable to Python
    py::class_<RateStatsTable> table(m, "RateStatsTable");

    py::class_<RateStatsTable::Entry>(table, "Entry")
        .def_readonly("rate", &RateStatsTable::Entry::rate)
        .def_readonly("txpower", &RateStatsTable::Entry::txpower)
        .def_readonly("stats", &RateStatsTable::Entry::stats)
        ;

    table
        .def(py::init<unsigned, unsigned>())
        .def_property_readonly("num_rates",
            &RateStatsTable::getNumRates,
            "int: Number of rates")
        .def_property_readonly("num_txpowers",
            &RateStatsTable::getNumTxPowers,
            "int: Number of TX power levels")
        .def("get",
            &RateStatsTable::get,
            py::arg("rate"),
            py::arg("txpower") = -1,
            "Get the statistics of a (rate, txpower) pair. -1 selects the unknown rate or power.")
        .def("entries",
            &RateStatsTable::entries,
            "Return every cell that has seen at least one attempt")
        .def("clear",
            &RateStatsTable::clear,
            "Zero every cell")
        ;
}

void exportStations(py::module &m)
{
    // Export class Transport to Python
    py::class_<Transport, PyTransport, std::shared_ptr<Transport>>(m, "Transport", "Connection to an access point")
        .def(py::init<>())
        .def("send",
            &Transport::send,
            "Send a command line")
        ;

    // Export class RadioInfo to Python
    py::class_<RadioInfo>(m, "RadioInfo")
        .def_readonly("num_rates", &RadioInfo::num_rates)
        .def_readonly("num_txpowers", &RadioInfo::num_txpowers)
        ;

    // Export class AccessPoint to Python
    py::class_<AccessPoint, std::shared_ptr<AccessPoint>>(m, "AccessPoint")
        .def(py::init<const std::string&, std::shared_ptr<Transport>>(),
            py::arg("name"),
            py::arg("transport"))
        .def(py::init<const std::string&, std::shared_ptr<Transport>, TimestampFormat>(),
            py::arg("name"),
            py::arg("transport"),
            py::arg("timestamp_format"))
        .def_property_readonly("name",
            &AccessPoint::getName,
            "str: Access point name")
        .def_property("timestamp_format",
            &AccessPoint::getTimestampFormat,
            &AccessPoint::setTimestampFormat,
            "TimestampFormat: Timestamp encoding of lines from this access point")
        .def_property_readonly("radios",
            &AccessPoint::getRadios,
            "List[str]: Radios")
        .def_property_readonly("last_command",
            &AccessPoint::getLastCommand,
            "Optional[str]: Most recent command")
        .def_property_readonly("api_version",
            &AccessPoint::getApiVersion,
            "Optional[Tuple[int, int]]: Announced API version")
        .def("addRadio",
            &AccessPoint::addRadio,
            py::arg("phy"),
            py::arg("num_rates"),
            py::arg("num_txpowers"),
            "Record the capabilities of a radio")
        .def("getRadio",
            &AccessPoint::getRadio,
            "Get the capabilities of a radio")
        .def("send",
            &AccessPoint::send,
            py::call_guard<py::gil_scoped_release>(),
            "Send a command line")
        .def("enableEvents",
            &AccessPoint::enableEvents,
            py::call_guard<py::gil_scoped_release>(),
            "Enable event streams of a radio")
        .def("disableEvents",
            &AccessPoint::disableEvents,
            py::call_guard<py::gil_scoped_release>(),
            "Disable event streams of a radio")
        ;

    // Export class Station to Python
    py::class_<Station, std::shared_ptr<Station>>(m, "Station")
        .def_property_readonly("access_point",
            &Station::getAccessPoint,
            "AccessPoint: The access point")
        .def_property_readonly("phy",
            &Station::getPhy,
            "str: Radio")
        .def_property_readonly("mac",
            &Station::getMac,
            "MacAddr: Station address")
        .def_property_readonly("iface",
            &Station::getInterface,
            "str: Network interface")
        .def_property_readonly("rc_mode",
            &Station::getRcMode,
            "ControlMode: Rate control mode")
        .def_property_readonly("tpc_mode",
            &Station::getTpcMode,
            "ControlMode: Power control mode")
        .def_property_readonly("associated",
            &Station::isAssociated,
            "bool: True if the station is associated")
        .def_property("pause_on_disassoc",
            &Station::getPauseOnDisassoc,
            &Station::setPauseOnDisassoc,
            "bool: Pause rather than stop rate control on disassociation")
        .def_property_readonly("last_seen",
            &Station::getLastSeen,
            "int: Timestamp of the most recent event (ns)")
        .def_property_readonly("supported_rates",
            &Station::getSupportedRates,
            "List[int]: Supported rate indices")
        .def_property_readonly("kernel_frequencies",
            &Station::getKernelFrequencies,
            "Tuple[int, int]: Kernel update and sample frequencies")
        .def_property_readonly("overheads",
            &Station::getOverheads,
            "Tuple[int, int]: MCS and legacy overheads")
        .def_property_readonly("rssi",
            &Station::getRssi,
            "Optional[int]: Minimum RSSI (dBm)")
        .def_property_readonly("rssi_vals",
            &Station::getRssiVals,
            "List[Optional[int]]: Per-antenna RSSI (dBm)")
        .def_property_readonly("rate_stats",
            py::overload_cast<>(&Station::getRateStats),
            py::return_value_policy::reference_internal,
            "RateStatsTable: Rate statistics")
        .def_property_readonly("control_task",
            &Station::getControlTask,
            "Optional[ControlTask]: Control task")
        .def("setManualRcMode",
            &Station::setManualRcMode,
            py::call_guard<py::gil_scoped_release>(),
            "Switch between manual and automatic rate control")
        .def("setManualTpcMode",
            &Station::setManualTpcMode,
            py::call_guard<py::gil_scoped_release>(),
            "Switch between manual and automatic power control")
        .def("setRates",
            &Station::setRates,
            py::call_guard<py::gil_scoped_release>(),
            "Install a rate table")
        .def("setPower",
            &Station::setPower,
            py::call_guard<py::gil_scoped_release>(),
            "Install a power table")
        .def("setRatesAndPower",
            &Station::setRatesAndPower,
            py::call_guard<py::gil_scoped_release>(),
            "Install a rate and power table")
        .def("setProbeRate",
            &Station::setProbeRate,
            py::arg("rate"),
            py::arg("txpower") = py::none(),
            py::call_guard<py::gil_scoped_release>(),
            "Probe a rate")
        .def("resetKernelRateStats",
            &Station::resetKernelRateStats,
            py::call_guard<py::gil_scoped_release>(),
            "Reset the kernel's statistics for this station")
        .def("resetRateStats",
            &Station::resetRateStats,
            "Reset our statistics for this station")
        .def("startRateControl",
            &Station::startRateControl,
            py::arg("algorithm"),
            py::arg("options") = AlgorithmOptions{},
            py::call_guard<py::gil_scoped_release>(),
            "Attach a rate control algorithm")
        .def("stopRateControl",
            &Station::stopRateControl,
            py::call_guard<py::gil_scoped_release>(),
            "Stop and detach the rate control algorithm")
        .def("pauseRateControl",
            &Station::pauseRateControl,
            py::call_guard<py::gil_scoped_release>(),
            "Pause the rate control algorithm")
        .def("resumeRateControl",
            &Station::resumeRateControl,
            py::call_guard<py::gil_scoped_release>(),
            "Resume the rate control algorithm")
        .def("__repr__", [](const Station &self) {
            return py::str("Station(phy={}, mac={})").format(self.getPhy(), self.getMac().toString());
         })
        ;
}
