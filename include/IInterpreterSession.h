// IInterpreterSession – Abstraktion einer laufenden Interpreter-Instanz
//
// Lebenszyklus = Objektlebensdauer:
//  - Konstruktion  : Interpreter vollständig initialisieren (alles oder nichts).
//                    Fehler -> StartupError, es wird kein Bootstrap-Code ausgeführt.
//  - runBootstrap  : Modul per Name importieren, Entry-Point ohne Argumente aufrufen,
//                    Ergebnis als BootstrapResult zurückgeben. Wirft nicht für
//                    Python-Fehler, die landen als BootstrapFailure im Ergebnis.
//  - Destruktor    : Interpreter genau einmal finalisieren.
//
// Konkrete Implementierung: PythonSession (pybind11). In den Tests wird die
// Schnittstelle gemockt, um Reihenfolge und Teardown des InterpreterHost zu prüfen.
#pragma once
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include "BootstrapResult.h"
#include "BootstrapUnit.h"

// Interpreter bzw. seine Laufzeitumgebung konnte nicht aufgebaut werden.
struct StartupError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct IInterpreterSession {
    virtual ~IInterpreterSession() = default;
    virtual BootstrapResult runBootstrap(const BootstrapUnit& unit) = 0;
};

// Erzeugt (= initialisiert) eine Session; darf StartupError werfen.
using SessionFactory = std::function<std::unique_ptr<IInterpreterSession>()>;
