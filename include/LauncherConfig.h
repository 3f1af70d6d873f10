// LauncherConfig – Optionen des eingebetteten Interpreters
//
// Die Defaults sind einkompiliert (Modul/Entry-Point per CLIPFIX_DEFAULT_MODULE /
// CLIPFIX_DEFAULT_ENTRY_POINT aus dem Build). Optional überschreibt eine JSON-Datei
// neben der Executable (clipfix.json) einzelne Felder:
//   {
//     "module": "clipfix.main", "entryPoint": "main",
//     "pythonHome": "", "packageRoots": ["python"],
//     "siteImport": true, "printTraceback": true,
//     "environment": { "TOKENIZERS_PARALLELISM": "false" },
//     "logLevel": "warn"
//   }
// Kommandozeile und Umgebungsvariablen werden vom Launcher NICHT ausgewertet.
#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "BootstrapUnit.h"
#include "Logger.h"

#ifndef CLIPFIX_DEFAULT_MODULE
#define CLIPFIX_DEFAULT_MODULE "clipfix.main"
#endif
#ifndef CLIPFIX_DEFAULT_ENTRY_POINT
#define CLIPFIX_DEFAULT_ENTRY_POINT "main"
#endif
#ifndef CLIPFIX_CONFIG_FILE
#define CLIPFIX_CONFIG_FILE "clipfix.json"
#endif

struct LauncherConfig {
    std::string module     = CLIPFIX_DEFAULT_MODULE;
    std::string entryPoint = CLIPFIX_DEFAULT_ENTRY_POINT;

    std::string              pythonHome;                 // leer = CPython-Default
    std::vector<std::string> packageRoots{ "python" };   // relativ -> baseDir
    bool siteImport     = true;
    bool printTraceback = true;

    // wird nur gesetzt, falls die Variable noch nicht existiert
    std::map<std::string, std::string> environment{
        { "TOKENIZERS_PARALLELISM",       "false" },
        { "HF_HUB_DISABLE_PROGRESS_BARS", "1"     },
    };

    Logger::LogLevel logLevel = Logger::LogLevel::Warn;

    // Verzeichnis, gegen das relative Pfade aufgelöst werden (Executable-Ordner)
    std::filesystem::path baseDir;

    BootstrapUnit bootstrapUnit() const { return BootstrapUnit{ module, entryPoint }; }

    // packageRoots als absolute Pfade (relativ zu baseDir)
    std::vector<std::string> resolvedPackageRoots() const;
};

// Überschreibt die in j vorhandenen Felder; false + err bei falschen Typen/Werten.
bool applyLauncherConfigJson(const nlohmann::json& j, LauncherConfig& cfg, std::string& err);

// Fehlende Datei ist kein Fehler (Defaults bleiben). false + err bei Lese-/Parse-Fehlern.
bool loadLauncherConfig(const std::filesystem::path& file, LauncherConfig& cfg, std::string& err);

// setenv(name, value, overwrite=0) für alle Einträge
void applyEnvironmentDefaults(const std::map<std::string, std::string>& env);

// Pfad der laufenden Executable (GetModuleFileNameW / _NSGetExecutablePath /
// /proc/self/exe); leer, falls das System ihn nicht liefert
std::filesystem::path executablePath();

// Ordner der laufenden Executable, argv0 nur als letzter Fallback
std::filesystem::path executableDir(const char* argv0);
