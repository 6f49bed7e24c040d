// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/embed.h>

namespace py = pybind11;

#include "python/PyModules.hh"

#if defined(PYMODULE)
PYBIND11_MODULE(_ratectl, m) {
#else /* !defined(PYMODULE) */
PYBIND11_EMBEDDED_MODULE(_ratectl, m) {
#endif /* !defined(PYMODULE) */
    auto mlogging = m.def_submodule("logging");
    auto mproto = m.def_submodule("proto");
    auto mrc = m.def_submodule("rc");

    exportLogger(mlogging);

    exportErrors(m);
    exportControllerConfig(m);

    exportEvents(mproto);
    exportDecoder(mproto);
    exportCommands(mproto);

    exportRateStats(m);
    exportRateControl(mrc);
    exportStations(m);
    exportDispatcher(m);
}
