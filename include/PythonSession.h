#pragma once
#include <pybind11/embed.h>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "IInterpreterSession.h"

namespace py = pybind11;

// Eingebetteter CPython-Interpreter als Session-Objekt (RAII).
// - ctor : PyConfig (isolated) aufbauen, py::scoped_interpreter starten, sys.path ergänzen
// - dtor : scoped_interpreter freigeben -> Py_FinalizeEx (genau einmal)
// Pro Prozess darf nur EINE Session entstehen; ein zweiter Versuch wirft StartupError,
// CPython wird nie neu initialisiert.
class PythonSession final : public IInterpreterSession {
public:
    struct Options {
        std::string              pythonHome;      // leer = CPython-Default
        std::vector<std::string> sysPaths;        // vorne in sys.path einfügen
        std::vector<std::string> argv;            // -> sys.argv (unverändert)
        bool siteImport     = true;
        bool printTraceback = true;
    };

    explicit PythonSession(Options o);
    ~PythonSession() override;

    PythonSession(const PythonSession&)            = delete;
    PythonSession& operator=(const PythonSession&) = delete;

    BootstrapResult runBootstrap(const BootstrapUnit& unit) override;

    // true, sobald in diesem Prozess eine Session angelegt wurde (auch bei Fehlschlag)
    static bool createdInProcess() { return created_.load(); }

private:
    BootstrapResult fromExitCode_(const py::handle& code);
    BootstrapResult failure_(BootstrapFailure::Kind kind, const py::error_already_set& e);
    static std::string describeException_(const py::error_already_set& e);
    void printTraceback_(const py::error_already_set& e) const;
    void extendSysPath_();

    Options opt_;
    std::unique_ptr<py::scoped_interpreter> guard_;

    static std::atomic<bool> created_;
};
