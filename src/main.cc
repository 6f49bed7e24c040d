// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <execinfo.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <pybind11/embed.h>

namespace py = pybind11;

using namespace pybind11::literals;

#include "Logger.hh"
#include "logging.hh"

#define MAXFRAMES 25

/** @brief A signal handler that prints a backtrace */
/** See:
 * https://stackoverflow.com/questions/77005/how-to-automatically-generate-a-stacktrace-when-my-program-crashes
 */
extern "C" void backtraceHandler(int signum, siginfo_t *si, void *ptr)
{
    void   *frames[MAXFRAMES];
    size_t nframes;

    // Get backtrace
    nframes = backtrace(frames, MAXFRAMES);

    // Print the backtrace to stderr
    fprintf(stderr, "CRASH: signal %d:\n", si->si_signo);
    backtrace_symbols_fd(frames, nframes, STDERR_FILENO);

    // Re-raise the signal to get a core dump
    signal(signum, SIG_DFL);
    raise(signum);
}

/** @brief Activate Python virtual environment */
/** If the environmement variable VIRTUAL_ENV is set, use the associated
 * virtualenv. This allows us to use the virtualenv even through the ratectl
 * binary is not located in the virtual environment's bin directory.
 */
void activateVirtualenv(void)
{
    char *venv = getenv("VIRTUAL_ENV");

    if (venv) {
        py::object join = py::module::import("os").attr("path").attr("join");
        py::object path = join(venv, "bin", "activate_this.py");

        py::eval_file(path, py::globals(), py::dict("__file__"_a=path));
    }
}

bool endswith(const char *s1, const char *s2)
{
    return strlen(s1) >= strlen(s2) && strcmp(s1 + strlen(s1) - strlen(s2), s2) == 0;
}

int main(int argc, char** argv)
{
    // If this binary's name ends in "python," just run the python interpreter.
    // This provides a standard Python interpreter with the complete ratectl
    // module available, which is useful for, e.g., mypy.
    if (argc > 0 && endswith(argv[0], "python")) {
        return Py_BytesMain(argc, argv);
    }

    if (argc == 1) {
        fprintf(stderr, "Must specify Python script to run.\n");
        exit(EXIT_FAILURE);
    }

    // Install backtrace signal handler
    struct sigaction s;

    s.sa_flags = SA_SIGINFO|SA_RESETHAND;
    s.sa_sigaction = backtraceHandler;
    sigemptyset(&s.sa_mask);
    sigaction(SIGSEGV, &s, 0);

    // Result returned by Python
    int ret;

    // Start the Python interpreter
    {
        // Pass our command-line arguments to Python, but skip the first
        // argument, which is the name of this binary. Instead, Python will see
        // the name of the script we run as the first argument.
        py::scoped_interpreter guard{ true, argc-1, argv+1, true };

        // Activate any Python virtual environment
        activateVirtualenv();

        logSystem(LOGDEBUG, "running %s", argv[1]);

        // Evaluate the Python script
        try {
            py::eval_file(argv[1]);
            ret = EXIT_SUCCESS;
        } catch (const py::error_already_set& e) {
            if (e.matches(py::module::import("builtins").attr("SystemExit"))) {
                auto args = py::tuple(e.value().attr("args"));

                if (args.size() == 0 || args[0].is_none())
                    ret = EXIT_SUCCESS;
                else if (py::isinstance<py::int_>(args[0]))
                    ret = py::cast<int>(args[0]);
                else {
                    fprintf(stderr, "%s\n", py::str(args[0]).cast<std::string>().c_str());
                    ret = EXIT_FAILURE;
                }
            } else {
                fprintf(stderr, "Python exception: %s\n", e.what());
                ret = EXIT_FAILURE;
            }
        } catch (const std::exception &e) {
            fprintf(stderr, "Python exception: %s\n", e.what());
            ret = EXIT_FAILURE;
        }
    }

    // Ensure logger is gracefully closed
    if (logger)
        logger->close();

    return ret;
}
