// BootstrapResult.h – Ergebnis eines Bootstrap-Laufs im eingebetteten Interpreter
//
// Der Bootstrap endet auf genau eine von drei Arten:
//  - ExitStatus       : das Programm hat sys.exit(<int>) gemeldet (bzw. einen int zurückgegeben)
//  - NoStatus         : sys.exit(None) / Rückgabe None -> Erfolg
//  - BootstrapFailure : unbehandelte Exception, Modul/Entry-Point nicht auflösbar
//                       oder ein sys.exit-Payload, der weder int noch None ist
//
// Die Python-Objekte werden bereits in der Session in diese Strukturen übersetzt,
// damit nach dem Finalisieren des Interpreters nichts mehr auf Python-State zeigt.
// exitStatusOf(...) bildet das Ergebnis auf den Prozess-Exitcode ab.
#pragma once
#include <string>
#include <variant>

// Reservierte Exitcodes des Launchers.
//  1   : wie CPython bei unbehandelter Exception
//  120 : Interpreter/Konfiguration konnte nicht gestartet werden
inline constexpr int kExitSuccess          = 0;
inline constexpr int kExitUnhandledFailure = 1;
inline constexpr int kExitStartupFailure   = 120;

struct ExitStatus {
    int code = 0;
};

struct NoStatus {};

struct BootstrapFailure {
    enum class Kind {
        Bootstrap,      // import/Attribut-Lookup des Entry-Points gescheitert
        Application,    // Entry-Point hat eine Exception geworfen
        InvalidStatus   // sys.exit("...") o. ä.: Payload weder int noch None
    };
    Kind        kind{Kind::Application};
    std::string description;   // z. B. "RuntimeError: bad input"
};

using BootstrapResult = std::variant<ExitStatus, NoStatus, BootstrapFailure>;

int         exitStatusOf(const BootstrapResult& r);
const char* toCStr(BootstrapFailure::Kind k);
std::string describe(const BootstrapResult& r);   // für Logs
