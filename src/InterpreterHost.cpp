#include "InterpreterHost.h"
#include "Logger.h"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

InterpreterHost::InterpreterHost(SessionFactory factory)
    : factory_(std::move(factory)) {}

const char* InterpreterHost::toCStr(State s) {
    switch (s) {
        case State::Uninitialized: return "Uninitialized";
        case State::Initializing:  return "Initializing";
        case State::Running:       return "Running";
        case State::Finalizing:    return "Finalizing";
        case State::Terminated:    return "Terminated";
    }
    return "?";
}

void InterpreterHost::transition_(State next) {
    logAt(Logger::LogLevel::Debug) << "[host] " << toCStr(state_) << " -> " << toCStr(next) << "\n";
    state_ = next;
}

int InterpreterHost::run(const BootstrapUnit& unit) {
    if (state_ != State::Uninitialized)
        throw std::logic_error("InterpreterHost::run called more than once");

    // 1) Session aufbauen – alles oder nichts
    transition_(State::Initializing);
    std::unique_ptr<IInterpreterSession> session;
    try {
        session = factory_ ? factory_() : nullptr;
    } catch (const std::exception& e) {   // StartupError und alles andere aus der Factory
        logAt(Logger::LogLevel::Error) << "startup failure: " << e.what() << "\n";
        transition_(State::Terminated);
        return kExitStartupFailure;
    }
    if (!session) {
        logAt(Logger::LogLevel::Error) << "startup failure: no interpreter session\n";
        transition_(State::Terminated);
        return kExitStartupFailure;
    }

    // 2) Bootstrap ausführen
    transition_(State::Running);
    BootstrapResult result = NoStatus{};
    try {
        result = session->runBootstrap(unit);
    } catch (const std::exception& e) {
        result = BootstrapFailure{ BootstrapFailure::Kind::Application, e.what() };
    }

    // 3) Teardown (genau einmal), erst danach wird das Ergebnis ausgewertet
    transition_(State::Finalizing);
    session.reset();
    transition_(State::Terminated);

    // 4) Ergebnis -> Exitcode
    const int status = exitStatusOf(result);
    if (const auto* f = std::get_if<BootstrapFailure>(&result)) {
        logAt(Logger::LogLevel::Error) << ::toCStr(f->kind) << " in " << unit.module << "."
                                       << unit.entryPoint << ": " << f->description << "\n";
    } else {
        logAt(Logger::LogLevel::Info) << describe(result) << " -> exit " << status << "\n";
    }
    return status;
}

void InterpreterHost::runAndExit(const BootstrapUnit& unit) {
    const int status = run(unit);
    std::cout.flush();
    std::exit(status);
}
