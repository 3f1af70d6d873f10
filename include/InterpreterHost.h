// InterpreterHost – verbindet den Lebenszyklus des Host-Prozesses mit dem des
// eingebetteten Interpreters.
//
// Ablauf von run(unit), strikt linear:
//   Uninitialized -> Initializing -> Running -> Finalizing -> Terminated
//   (Startfehler: Initializing -> Terminated, Bootstrap-Code läuft dann nie)
//  1) Session über die SessionFactory erzeugen (= Interpreter initialisieren)
//  2) Bootstrap-Unit ausführen, BootstrapResult abholen
//  3) Session in JEDEM Fall freigeben (unique_ptr, auch bei Exceptions)
//  4) Ergebnis -> Exitcode (exitStatusOf), Diagnose nach stderr
// runAndExit(unit) beendet danach den Prozess mit genau diesem Status.
#pragma once
#include "IInterpreterSession.h"

class InterpreterHost {
public:
    enum class State { Uninitialized, Initializing, Running, Finalizing, Terminated };

    explicit InterpreterHost(SessionFactory factory);

    // Höchstens einmal pro Host; ein zweiter Aufruf wirft std::logic_error.
    int run(const BootstrapUnit& unit);

    [[noreturn]] void runAndExit(const BootstrapUnit& unit);

    State state() const { return state_; }
    static const char* toCStr(State s);

private:
    void transition_(State next);

    SessionFactory factory_;
    State state_{State::Uninitialized};
};
