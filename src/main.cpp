#include "InterpreterHost.h"
#include "LauncherConfig.h"
#include "Logger.h"
#include "PythonSession.h"
#include <memory>
#include <string>

static PythonSession::Options sessionOptionsFrom(const LauncherConfig& cfg, int argc, char* argv[]) {
    PythonSession::Options opt;
    opt.pythonHome     = cfg.pythonHome;
    opt.sysPaths       = cfg.resolvedPackageRoots();
    opt.siteImport     = cfg.siteImport;
    opt.printTraceback = cfg.printTraceback;
    opt.argv.assign(argv, argv + argc);   // unverändert an sys.argv
    return opt;
}

int main(int argc, char* argv[]) {
    // 1) Konfiguration: Defaults + optional clipfix.json neben der Executable
    LauncherConfig cfg;
    cfg.baseDir = executableDir(argc > 0 ? argv[0] : nullptr);

    std::string err;
    if (!loadLauncherConfig(cfg.baseDir / CLIPFIX_CONFIG_FILE, cfg, err)) {
        logAt(Logger::LogLevel::Error) << "startup failure: config: " << err << "\n";
        return kExitStartupFailure;
    }
    Logger::instance().setLogLevel(cfg.logLevel);

    // 2) Umgebung für das eingebettete Programm (nur setzen, nie auswerten)
    applyEnvironmentDefaults(cfg.environment);

    // 3) Interpreter starten, Bootstrap ausführen, Prozess mit dessen Status beenden
    const PythonSession::Options opt = sessionOptionsFrom(cfg, argc, argv);
    InterpreterHost host([opt] { return std::make_unique<PythonSession>(opt); });
    host.runAndExit(cfg.bootstrapUnit());
}
