// BootstrapUnit – fest einkompilierter Startcode für den eingebetteten Interpreter
//
// Entspricht dem Python-Snippet
//     import sys
//     from <module> import <entryPoint>
//     sys.exit(<entryPoint>())
// Die Session führt die Schritte einzeln aus, damit Import-Fehler, Exceptions im
// Entry-Point und das sys.exit-Signal sauber unterschieden werden können.
#pragma once
#include <string>

struct BootstrapUnit {
    std::string module;       // z. B. "clipfix.main"
    std::string entryPoint;   // z. B. "main" (ohne Argumente aufgerufen)

    std::string script() const {
        return "import sys\nfrom " + module + " import " + entryPoint
             + "\nsys.exit(" + entryPoint + "())\n";
    }
};
