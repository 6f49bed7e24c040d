// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "Dispatcher.hh"
#include "StationRegistry.hh"
#include "python/PyModules.hh"

/* Trampoline class for StationRegistryListener */
class PyStationRegistryListener : public StationRegistryListener {
public:
    /* Inherit the constructors */
    using StationRegistryListener::StationRegistryListener;

    void stationAdded(const std::shared_ptr<Station> &sta) override
    {
        py::gil_scoped_acquire acquire;

        PYBIND11_OVERRIDE(
            void,                    /* Return type */
            StationRegistryListener, /* Parent class */
            stationAdded,            /* Name of function in C++ (must match Python name) */
            sta                      /* Argument(s) */
        );
    }

    void stationRemoved(const std::shared_ptr<Station> &sta) override
    {
        py::gil_scoped_acquire acquire;

        PYBIND11_OVERRIDE(
            void,                    /* Return type */
            StationRegistryListener, /* Parent class */
            stationRemoved,          /* Name of function in C++ (must match Python name) */
            sta                      /* Argument(s) */
        );
    }
};

/* Trampoline class for DispatcherListener */
class PyDispatcherListener : public DispatcherListener {
public:
    /* Inherit the constructors */
    using DispatcherListener::DispatcherListener;

    void eventDecoded(const std::string &ap, const Event &ev) override
    {
        py::gil_scoped_acquire acquire;

        PYBIND11_OVERRIDE(
            void,               /* Return type */
            DispatcherListener, /* Parent class */
            eventDecoded,       /* Name of function in C++ (must match Python name) */
            ap,                 /* Argument(s) */
            ev
        );
    }

    void decodeFailed(const std::string &ap,
                      const std::string &line,
                      ErrorCode err) override
    {
        py::gil_scoped_acquire acquire;

        PYBIND11_OVERRIDE(
            void,               /* Return type */
            DispatcherListener, /* Parent class */
            decodeFailed,       /* Name of function in C++ (must match Python name) */
            ap,                 /* Argument(s) */
            line,
            err
        );
    }
};

void exportDispatcher(py::module &m)
{
    // Export class StationRegistryListener to Python
    py::class_<StationRegistryListener, PyStationRegistryListener, std::shared_ptr<StationRegistryListener>>
              (m, "StationRegistryListener", "A listener for station registry events")
        .def(py::init<>())
        .def("stationAdded",
            &StationRegistryListener::stationAdded,
            "Called when a new station is added")
        .def("stationRemoved",
            &StationRegistryListener::stationRemoved,
            "Called when a station is removed")
        ;

    // Export class StationRegistry to Python
    py::class_<StationRegistry, std::shared_ptr<StationRegistry>>(m, "StationRegistry", "All known access points and stations")
        .def(py::init<>())
        .def_property_readonly("access_points",
            &StationRegistry::getAccessPoints,
            "List[AccessPoint]: Access points")
        .def_property_readonly("stations",
            &StationRegistry::getStations,
            "Dict[Tuple[str, MacAddr], Station]: Stations")
        .def_property("default_rate_control",
            &StationRegistry::getDefaultRateControl,
            [](StationRegistry &self, std::shared_ptr<RateControlAlgorithm> alg) {
                self.setDefaultRateControl(alg);
            },
            "RateControlAlgorithm: Algorithm attached to newly created stations")
        .def("setDefaultRateControl",
            &StationRegistry::setDefaultRateControl,
            py::arg("algorithm"),
            py::arg("options") = AlgorithmOptions{},
            "Set the algorithm attached to newly created stations")
        .def("__len__",
            &StationRegistry::size)
        .def("addAccessPoint",
            &StationRegistry::addAccessPoint,
            "Add an access point")
        .def("removeAccessPoint",
            &StationRegistry::removeAccessPoint,
            py::call_guard<py::gil_scoped_release>(),
            "Remove an access point and all of its stations")
        .def("getAccessPoint",
            &StationRegistry::getAccessPoint,
            "Get an access point")
        .def("lookup",
            &StationRegistry::lookup,
            "Look up a station")
        .def("getOrCreate",
            &StationRegistry::getOrCreate,
            py::call_guard<py::gil_scoped_release>(),
            "Look up a station, creating it if it is not known")
        .def("remove",
            &StationRegistry::remove,
            py::call_guard<py::gil_scoped_release>(),
            "Remove a station")
        .def("addListener",
            &StationRegistry::addListener,
            "Add a listener")
        .def("removeListener",
            &StationRegistry::removeListener,
            "Remove a listener")
        ;

    // Export class DispatchResult to Python
    py::class_<DispatchResult>(m, "DispatchResult")
        .def_readonly("event",
            &DispatchResult::event,
            "Optional[Event]: The decoded event")
        .def_readonly("error",
            &DispatchResult::error,
            "Optional[ErrorCode]: The error that occurred")
        .def_readonly("message",
            &DispatchResult::message,
            "str: Error description")
        .def_property_readonly("ok",
            &DispatchResult::ok,
            "bool: True if the line was decoded and routed without error")
        ;

    // Export class DispatcherListener to Python
    py::class_<DispatcherListener, PyDispatcherListener, std::shared_ptr<DispatcherListener>>
              (m, "DispatcherListener", "A listener for dispatched events")
        .def(py::init<>())
        .def("eventDecoded",
            &DispatcherListener::eventDecoded,
            "Called for every decoded event")
        .def("decodeFailed",
            &DispatcherListener::decodeFailed,
            "Called for every line that could not be decoded")
        ;

    // Export class Dispatcher to Python
    py::class_<Dispatcher, std::shared_ptr<Dispatcher>>(m, "Dispatcher", "Decode lines and route events to stations")
        .def(py::init<std::shared_ptr<StationRegistry>>())
        .def_property_readonly("registry",
            &Dispatcher::getRegistry,
            "StationRegistry: The station registry")
        .def("process",
            [](Dispatcher &self, const std::string &ap, const std::string &line) {
                return self.process(ap, line);
            },
            py::call_guard<py::gil_scoped_release>(),
            "Process one line received from an access point")
        .def("addListener",
            &Dispatcher::addListener,
            "Add a listener")
        .def("removeListener",
            &Dispatcher::removeListener,
            "Remove a listener")
        ;
}
