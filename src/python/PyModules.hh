// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PYMODULES_H_
#define PYMODULES_H_

#include <pybind11/pybind11.h>

#include "Dispatcher.hh"
#include "StationRegistry.hh"
#include "net/Transport.hh"
#include "python/py_shared_ptr.hh"
#include "rc/RateControlAlgorithm.hh"

namespace py = pybind11;

#if !defined(DOXYGEN)
PY_SHARED_PTR_HOLDER(Transport)
PY_SHARED_PTR_HOLDER(RateControlAlgorithm)
PY_SHARED_PTR_HOLDER(StationRegistryListener)
PY_SHARED_PTR_HOLDER(DispatcherListener)
#endif /* !defined(DOXYGEN) */

void exportLogger(py::module &m);
void exportControllerConfig(py::module &m);
void exportErrors(py::module &m);
void exportEvents(py::module &m);
void exportDecoder(py::module &m);
void exportCommands(py::module &m);
void exportRateStats(py::module &m);
void exportRateControl(py::module &m);
void exportStations(py::module &m);
void exportDispatcher(py::module &m);

#endif /* PYMODULES_H_ */
