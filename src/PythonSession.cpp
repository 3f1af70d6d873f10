// PythonSession (pybind11-Laufzeitwache des Launchers)
// - Hält den py::scoped_interpreter in einem std::unique_ptr; Lebensdauer der Session =
//   Lebensdauer des Interpreters.
// - Startet CPython über PyConfig im "isolated"-Profil: PYTHON*-Umgebungsvariablen und die
//   Kommandozeile werden vom Interpreter nicht ausgewertet, argv landet nur in sys.argv.
// - runBootstrap() entspricht "import sys; from M import f; sys.exit(f())", übersetzt aber
//   jedes Ende (SystemExit, Exception, Import-Fehler) in ein BootstrapResult, bevor der
//   Interpreter finalisiert wird.
#include "PythonSession.h"
#include "Logger.h"

std::atomic<bool> PythonSession::created_{false};

namespace {
StartupError statusError(const char* what, const PyStatus& st) {
    return StartupError(std::string(what) + ": "
                        + (st.err_msg ? st.err_msg : "unknown error"));
}
}

PythonSession::PythonSession(Options o) : opt_(std::move(o)) {
    if (created_.exchange(true))
        throw StartupError("interpreter session already created in this process");
    if (Py_IsInitialized())
        throw StartupError("Python interpreter already running");

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.site_import             = opt_.siteImport ? 1 : 0;
    config.install_signal_handlers = 1;   // Ctrl-C -> KeyboardInterrupt wie bei python(1)

    if (!opt_.pythonHome.empty()) {
        PyStatus st = PyConfig_SetBytesString(&config, &config.home, opt_.pythonHome.c_str());
        if (PyStatus_Exception(st)) {
            PyConfig_Clear(&config);
            throw statusError("invalid pythonHome", st);
        }
    }

    std::vector<const char*> argv;
    argv.reserve(opt_.argv.size());
    for (const auto& a : opt_.argv) argv.push_back(a.c_str());

    logAt(Logger::LogLevel::Debug) << "initializing Python (home='"
                                   << (opt_.pythonHome.empty() ? "<default>" : opt_.pythonHome)
                                   << "', site=" << opt_.siteImport << ")\n";
    try {
        // scoped_interpreter übernimmt config und ruft in jedem Fall PyConfig_Clear
        guard_ = std::make_unique<py::scoped_interpreter>(
            &config, static_cast<int>(argv.size()), argv.empty() ? nullptr : argv.data(),
            /*add_program_dir_to_path*/ false);
    } catch (const std::exception& e) {
        throw StartupError(std::string("Python initialization failed: ") + e.what());
    }

    // Exception-Objekt muss vor dem Finalisieren freigegeben sein
    std::string pathErr;
    try {
        extendSysPath_();
    } catch (const py::error_already_set& e) {
        pathErr = e.what();
    }
    if (!pathErr.empty()) {
        guard_.reset();
        throw StartupError("cannot prepare sys.path: " + pathErr);
    }
    logAt(Logger::LogLevel::Debug) << "Python " << Py_GetVersion() << " running\n";
}

PythonSession::~PythonSession() {
    if (!guard_) return;
    guard_.reset();   // Py_FinalizeEx, flusht sys.stdout/sys.stderr
    logAt(Logger::LogLevel::Debug) << "interpreter finalized\n";
}

void PythonSession::extendSysPath_() {
    py::module_ sys  = py::module_::import("sys");
    py::list    path = sys.attr("path").cast<py::list>();
    // rückwärts einfügen, damit die Reihenfolge aus der Konfiguration erhalten bleibt
    for (auto it = opt_.sysPaths.rbegin(); it != opt_.sysPaths.rend(); ++it) {
        path.insert(0, py::cast(*it));
        logAt(Logger::LogLevel::Debug) << "sys.path += " << *it << "\n";
    }
}

BootstrapResult PythonSession::runBootstrap(const BootstrapUnit& unit) {
    logAt(Logger::LogLevel::Debug) << "bootstrap:\n" << unit.script();

    // 1) Modul importieren + Entry-Point auflösen
    py::object entry;
    try {
        py::module_ mod = py::module_::import(unit.module.c_str());
        entry = mod.attr(unit.entryPoint.c_str());
    } catch (const py::error_already_set& e) {
        if (e.matches(PyExc_SystemExit)) {
            py::object code = e.value().attr("code");
            return fromExitCode_(code);
        }
        return failure_(BootstrapFailure::Kind::Bootstrap, e);
    }
    if (!PyCallable_Check(entry.ptr())) {
        return BootstrapFailure{ BootstrapFailure::Kind::Bootstrap,
                                 unit.module + "." + unit.entryPoint + " is not callable" };
    }

    // 2) Entry-Point ohne Argumente aufrufen, Rückgabe an sys.exit() weiterreichen
    try {
        py::object ret = entry();
        py::module_::import("sys").attr("exit")(ret);
        // sys.exit wurde überschrieben und hat nicht geworfen
        return fromExitCode_(ret);
    } catch (const py::error_already_set& e) {
        if (e.matches(PyExc_SystemExit)) {
            py::object code = e.value().attr("code");
            return fromExitCode_(code);
        }
        return failure_(BootstrapFailure::Kind::Application, e);
    } catch (const std::exception& e) {
        return BootstrapFailure{ BootstrapFailure::Kind::Application, e.what() };
    }
}

// Gleiche Regeln wie CPython beim Beenden über SystemExit:
//   None -> 0, int (auch bool) -> Wert, alles andere -> Text nach stderr und Status 1
BootstrapResult PythonSession::fromExitCode_(const py::handle& code) {
    if (code.is_none()) return NoStatus{};
    if (py::isinstance<py::int_>(code)) {
        int overflow = 0;
        long long v = PyLong_AsLongLongAndOverflow(code.ptr(), &overflow);
        if (overflow != 0) v = -1;
        return ExitStatus{ static_cast<int>(v) };
    }
    return BootstrapFailure{ BootstrapFailure::Kind::InvalidStatus, std::string(py::str(code)) };
}

BootstrapResult PythonSession::failure_(BootstrapFailure::Kind kind, const py::error_already_set& e) {
    if (opt_.printTraceback) printTraceback_(e);
    return BootstrapFailure{ kind, describeException_(e) };
}

std::string PythonSession::describeException_(const py::error_already_set& e) {
    try {
        std::string desc = py::str(e.type().attr("__name__"));
        const std::string msg = py::str(e.value());
        if (!msg.empty()) desc += ": " + msg;
        return desc;
    } catch (const py::error_already_set&) {
        return e.what();
    }
}

void PythonSession::printTraceback_(const py::error_already_set& e) const {
    try {
        py::object tb = e.trace() ? py::reinterpret_borrow<py::object>(e.trace()) : py::none();
        py::module_::import("traceback").attr("print_exception")(e.type(), e.value(), tb);
        py::module_::import("sys").attr("stderr").attr("flush")();
    } catch (const py::error_already_set& inner) {
        logAt(Logger::LogLevel::Warn) << "traceback unavailable: " << inner.what() << "\n";
    }
}
