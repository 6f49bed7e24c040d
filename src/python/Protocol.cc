// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/pybind11.h>
#include <pybind11/operators.h>
#include <pybind11/stl.h>

#include "proto/Command.hh"
#include "proto/Events.hh"
#include "proto/LineDecoder.hh"
#include "python/PyModules.hh"
#include "util/net.hh"

void exportEvents(py::module &m)
{
    // Export class MacAddr to Python
    py::class_<MacAddr>(m, "MacAddr")
        .def(py::init<>())
        .def(py::init([](const std::string &s) { return parseMAC(s); }))
        .def_property_readonly("is_broadcast",
            [](const MacAddr &self) { return isEthernetBroadcast(self); },
            "bool: True if this is the broadcast address")
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def("__hash__",
            [](const MacAddr &self) { return std::hash<MacAddr>{}(self); })
        .def("__str__",
            &MacAddr::toString)
        .def("__repr__", [](const MacAddr &self) {
            return py::str("MacAddr('{}')").format(self.toString());
         })
        ;

    py::implicitly_convertible<py::str, MacAddr>();

    // Export enums
    py::enum_<TimestampFormat>(m, "TimestampFormat")
        .value("hex", TimestampFormat::kHex)
        .value("sec_nsec", TimestampFormat::kSecNsec)
        ;

    py::enum_<ControlMode>(m, "ControlMode")
        .value("auto", ControlMode::kAuto)
        .value("manual", ControlMode::kManual)
        ;

    // Export MRR types
    py::class_<MrrStage>(m, "MrrStage")
        .def(py::init<>())
        .def_readonly("rate",
            &MrrStage::rate,
            "int: Rate index, or -1 if absent")
        .def_readonly("count",
            &MrrStage::count,
            "int: Retry count")
        .def_readonly("txpower",
            &MrrStage::txpower,
            "int: TX power index, or -1 if absent")
        .def_readonly("attempts",
            &MrrStage::attempts,
            "int: Attempts")
        .def_readonly("successes",
            &MrrStage::successes,
            "int: Successes")
        .def_property_readonly("present",
            &MrrStage::isPresent,
            "bool: True if the stage was attempted")
        .def("__repr__", [](const MrrStage &self) {
            return py::str("MrrStage(rate={}, count={}, txpower={}, attempts={}, successes={})")
                .format(self.rate, self.count, self.txpower, self.attempts, self.successes);
         })
        ;

    py::class_<MrrChain>(m, "MrrChain")
        .def(py::init<>())
        .def_readonly("stages",
            &MrrChain::stages,
            "List[MrrStage]: Retry stages")
        .def_readonly("npresent",
            &MrrChain::npresent,
            "int: Number of populated stages")
        .def_readonly("credited",
            &MrrChain::credited,
            "Optional[int]: Index of the stage credited with acknowledged frames")
        ;

    // Export events
    py::class_<TxStatusEvent>(m, "TxStatusEvent")
        .def(py::init<>())
        .def_readonly("phy", &TxStatusEvent::phy)
        .def_readonly("timestamp", &TxStatusEvent::timestamp)
        .def_readonly("mac", &TxStatusEvent::mac)
        .def_readonly("num_frames", &TxStatusEvent::num_frames)
        .def_readonly("num_acked", &TxStatusEvent::num_acked)
        .def_readonly("probe", &TxStatusEvent::probe)
        .def_readonly("mrr", &TxStatusEvent::mrr)
        ;

    py::class_<RateStatsEvent>(m, "RateStatsEvent")
        .def(py::init<>())
        .def_readonly("phy", &RateStatsEvent::phy)
        .def_readonly("timestamp", &RateStatsEvent::timestamp)
        .def_readonly("mac", &RateStatsEvent::mac)
        .def_readonly("rate", &RateStatsEvent::rate)
        .def_readonly("avg_prob", &RateStatsEvent::avg_prob)
        .def_readonly("avg_tp", &RateStatsEvent::avg_tp)
        .def_readonly("cur_success", &RateStatsEvent::cur_success)
        .def_readonly("cur_attempts", &RateStatsEvent::cur_attempts)
        .def_readonly("hist_success", &RateStatsEvent::hist_success)
        .def_readonly("hist_attempts", &RateStatsEvent::hist_attempts)
        ;

    py::class_<RxStatusEvent>(m, "RxStatusEvent")
        .def(py::init<>())
        .def_readonly("phy", &RxStatusEvent::phy)
        .def_readonly("timestamp", &RxStatusEvent::timestamp)
        .def_readonly("mac", &RxStatusEvent::mac)
        .def_readonly("min_rssi", &RxStatusEvent::min_rssi)
        .def_readonly("rssi", &RxStatusEvent::rssi)
        ;

    py::class_<StationAddEvent> sta_add(m, "StationAddEvent");

    py::enum_<StationAddEvent::Kind>(sta_add, "Kind")
        .value("add", StationAddEvent::kAdd)
        .value("dump", StationAddEvent::kDump)
        .value("update", StationAddEvent::kUpdate)
        ;

    sta_add
        .def(py::init<>())
        .def_readonly("phy", &StationAddEvent::phy)
        .def_readonly("timestamp", &StationAddEvent::timestamp)
        .def_readonly("kind", &StationAddEvent::kind)
        .def_readonly("mac", &StationAddEvent::mac)
        .def_readonly("iface", &StationAddEvent::iface)
        .def_readonly("rc_mode", &StationAddEvent::rc_mode)
        .def_readonly("tpc_mode", &StationAddEvent::tpc_mode)
        .def_readonly("overhead_mcs", &StationAddEvent::overhead_mcs)
        .def_readonly("overhead_legacy", &StationAddEvent::overhead_legacy)
        .def_readonly("update_freq", &StationAddEvent::update_freq)
        .def_readonly("sample_freq", &StationAddEvent::sample_freq)
        .def_readonly("group_masks", &StationAddEvent::group_masks)
        .def_property_readonly("supported_rates",
            &StationAddEvent::supportedRates,
            "List[int]: Supported rate indices")
        ;

    py::class_<StationRemoveEvent>(m, "StationRemoveEvent")
        .def(py::init<>())
        .def_readonly("phy", &StationRemoveEvent::phy)
        .def_readonly("timestamp", &StationRemoveEvent::timestamp)
        .def_readonly("mac", &StationRemoveEvent::mac)
        ;

    py::class_<ModeAckEvent> mode_ack(m, "ModeAckEvent");

    py::enum_<ModeAckEvent::Kind>(mode_ack, "Kind")
        .value("rate", ModeAckEvent::kRate)
        .value("power", ModeAckEvent::kPower)
        ;

    mode_ack
        .def(py::init<>())
        .def_readonly("phy", &ModeAckEvent::phy)
        .def_readonly("timestamp", &ModeAckEvent::timestamp)
        .def_readonly("kind", &ModeAckEvent::kind)
        .def_readonly("mac", &ModeAckEvent::mac)
        .def_readonly("mode", &ModeAckEvent::mode)
        ;

    py::class_<DeviceErrorEvent>(m, "DeviceErrorEvent")
        .def(py::init<>())
        .def_readonly("message", &DeviceErrorEvent::message)
        ;

    py::class_<ApiVersionEvent>(m, "ApiVersionEvent")
        .def(py::init<>())
        .def_readonly("major", &ApiVersionEvent::major)
        .def_readonly("minor", &ApiVersionEvent::minor)
        .def_property_readonly("supported",
            &ApiVersionEvent::isSupported,
            "bool: True if this controller speaks this API version")
        ;

    m.def("eventName",
        &eventName,
        "Return the record name of an event");
}

void exportDecoder(py::module &m)
{
    // Export class LineDecoder to Python
    py::class_<LineDecoder>(m, "LineDecoder")
        .def(py::init<TimestampFormat>(),
            py::arg("timestamp_format") = TimestampFormat::kHex)
        .def_property("timestamp_format",
            &LineDecoder::getTimestampFormat,
            &LineDecoder::setTimestampFormat,
            "TimestampFormat: Timestamp encoding")
        .def("decode",
            [](const LineDecoder &self, const std::string &line) {
                return self.decode(line);
            },
            "Decode a line")
        .def("decodeTxStatus",
            [](const LineDecoder &self, const std::string &line) {
                return self.decodeTxStatus(line);
            },
            "Decode a transmission status line")
        ;
}

void exportCommands(py::module &m)
{
    auto mcmd = m.def_submodule("cmd");

    mcmd.def("rcMode", &cmd::rcMode,
        "Set rate control mode of a radio");
    mcmd.def("tpcMode", &cmd::tpcMode,
        "Set power control mode of a radio");
    mcmd.def("setRates", &cmd::setRates,
        "Install a rate table for a station");
    mcmd.def("setPower", &cmd::setPower,
        "Install a power table for a station");
    mcmd.def("setRatesPower", &cmd::setRatesPower,
        "Install a rate and power table for a station");
    mcmd.def("probe", &cmd::probe,
        py::arg("phy"),
        py::arg("mac"),
        py::arg("rate"),
        py::arg("txpower") = py::none(),
        "Probe a rate");
    mcmd.def("resetStats", &cmd::resetStats,
        "Reset the kernel's statistics for a station");
    mcmd.def("startEvents", &cmd::startEvents,
        "Enable event streams of a radio");
    mcmd.def("stopEvents", &cmd::stopEvents,
        "Disable event streams of a radio");
}
