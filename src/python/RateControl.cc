// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "Station.hh"
#include "rc/CancellationToken.hh"
#include "rc/ControlTask.hh"
#include "rc/KernelRateControl.hh"
#include "rc/RateControlAlgorithm.hh"
#include "python/PyModules.hh"

/** @brief Context produced by an algorithm written in Python */
/** Holds whatever object the Python configure hook returned. */
class PyAlgorithmContext : public AlgorithmContext {
public:
    explicit PyAlgorithmContext(py::object obj)
      : obj_(std::move(obj))
    {
    }

    virtual ~PyAlgorithmContext()
    {
        py::gil_scoped_acquire gil;

        obj_ = py::object();
    }

    /** @brief Get the Python context object. Caller must hold the GIL. */
    const py::object &getObject(void) const
    {
        return obj_;
    }

private:
    py::object obj_;
};

/** @brief Return the Python object of a context. Caller must hold the GIL. */
static py::object contextObject(const std::shared_ptr<AlgorithmContext> &ctx)
{
    auto pyctx = std::dynamic_pointer_cast<PyAlgorithmContext>(ctx);

    if (pyctx)
        return pyctx->getObject();
    else
        return py::none();
}

/* Trampoline class for RateControlAlgorithm */
class PyRateControlAlgorithm : public RateControlAlgorithm {
public:
    /* Inherit the constructors */
    using RateControlAlgorithm::RateControlAlgorithm;

    std::string getName(void) const override
    {
        PYBIND11_OVERLOAD_PURE(
            std::string,          /* Return type */
            RateControlAlgorithm, /* Parent class */
            getName,              /* Name of function in C++ (must match Python name) */
        );
    }

    std::shared_ptr<AlgorithmContext> configure(const std::shared_ptr<Station> &sta,
                                                const AlgorithmOptions &opts) override
    {
        py::gil_scoped_acquire gil;
        py::function           overload = getOverload("configure");

        if (!overload)
            py::pybind11_fail("Tried to call pure virtual function \"RateControlAlgorithm::configure\"");

        return std::make_shared<PyAlgorithmContext>(overload(sta, opts));
    }

    void run(const std::shared_ptr<AlgorithmContext> &ctx,
             CancellationToken &token) override
    {
        py::gil_scoped_acquire gil;
        py::function           overload = getOverload("run");

        if (!overload)
            py::pybind11_fail("Tried to call pure virtual function \"RateControlAlgorithm::run\"");

        overload(contextObject(ctx), py::cast(&token, py::return_value_policy::reference));
    }

    bool canPause(void) const override
    {
        py::gil_scoped_acquire gil;

        return getOverload("pause") && getOverload("resume");
    }

    void pause(const std::shared_ptr<AlgorithmContext> &ctx) override
    {
        py::gil_scoped_acquire gil;
        py::function           overload = getOverload("pause");

        if (overload)
            overload(contextObject(ctx));
    }

    void resume(const std::shared_ptr<AlgorithmContext> &ctx) override
    {
        py::gil_scoped_acquire gil;
        py::function           overload = getOverload("resume");

        if (overload)
            overload(contextObject(ctx));
    }

private:
    /** @brief Find a Python override. Caller must hold the GIL. */
    py::function getOverload(const char *name) const
    {
        return py::get_overload(static_cast<const RateControlAlgorithm *>(this), name);
    }
};

void exportRateControl(py::module &m)
{
    // Export class CancellationToken to Python
    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def_property_readonly("cancelled",
            &CancellationToken::isCancelled,
            "bool: True if the token has been cancelled")
        .def("cancel",
            &CancellationToken::cancel,
            "Cancel")
        .def("wait",
            &CancellationToken::wait,
            py::call_guard<py::gil_scoped_release>(),
            "Wait until the token is cancelled")
        .def("waitFor",
            [](const CancellationToken &self, double timeout) {
                return self.waitFor(std::chrono::duration<double>(timeout));
            },
            py::call_guard<py::gil_scoped_release>(),
            "Wait at most timeout seconds for the token to be cancelled. Return True if it was.")
        ;

    // Export class RateControlAlgorithm to Python
    py::class_<RateControlAlgorithm, PyRateControlAlgorithm, std::shared_ptr<RateControlAlgorithm>>
              (m, "RateControlAlgorithm", "A rate control algorithm")
        .def(py::init<>())
        .def_property_readonly("name",
            &RateControlAlgorithm::getName,
            "str: Algorithm name")
        .def_property_readonly("can_pause",
            &RateControlAlgorithm::canPause,
            "bool: True if the algorithm has pause and resume hooks")
        ;

    // Export class KernelRateControl to Python
    py::class_<KernelRateControl, RateControlAlgorithm, std::shared_ptr<KernelRateControl>>
              (m, "KernelRateControl", "Leave rate and power selection to the device")
        .def(py::init<>())
        ;

    // Export class ControlTask to Python
    py::class_<ControlTask, std::shared_ptr<ControlTask>> task(m, "ControlTask");

    py::enum_<ControlTask::State>(task, "State")
        .value("unconfigured", ControlTask::kUnconfigured)
        .value("configuring", ControlTask::kConfiguring)
        .value("running", ControlTask::kRunning)
        .value("paused", ControlTask::kPaused)
        .value("stopped", ControlTask::kStopped)
        ;

    task
        .def_property_readonly("state",
            &ControlTask::getState,
            "ControlTask.State: Current state")
        .def_property_readonly("error",
            &ControlTask::getError,
            "Optional[ErrorCode]: Error that stopped the task")
        .def_property_readonly("error_message",
            &ControlTask::getErrorMessage,
            "str: Description of the error that stopped the task")
        .def_property_readonly("algorithm",
            &ControlTask::getAlgorithm,
            "RateControlAlgorithm: The algorithm")
        .def_property_readonly("options",
            &ControlTask::getOptions,
            "Dict[str, str]: Algorithm options")
        .def("start",
            &ControlTask::start,
            py::call_guard<py::gil_scoped_release>(),
            "Start configuring")
        .def("pause",
            &ControlTask::pause,
            py::call_guard<py::gil_scoped_release>(),
            "Pause")
        .def("resume",
            &ControlTask::resume,
            py::call_guard<py::gil_scoped_release>(),
            "Resume")
        .def("stop",
            &ControlTask::stop,
            py::call_guard<py::gil_scoped_release>(),
            "Stop")
        .def("__repr__", [](const ControlTask &self) {
            return py::str("ControlTask(algorithm={}, state={})")
                .format(self.getAlgorithm()->getName(), controlTaskState2string(self.getState()));
         })
        ;
}
