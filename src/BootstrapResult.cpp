#include "BootstrapResult.h"
#include <type_traits>

int exitStatusOf(const BootstrapResult& r) {
    return std::visit([](auto&& x) -> int {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, ExitStatus>) return x.code;
        else if constexpr (std::is_same_v<T, NoStatus>) return kExitSuccess;
        else return kExitUnhandledFailure;
    }, r);
}

const char* toCStr(BootstrapFailure::Kind k) {
    switch (k) {
        case BootstrapFailure::Kind::Bootstrap:     return "bootstrap failure";
        case BootstrapFailure::Kind::Application:   return "application failure";
        case BootstrapFailure::Kind::InvalidStatus: return "non-integer exit status";
    }
    return "failure";
}

std::string describe(const BootstrapResult& r) {
    return std::visit([](auto&& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, ExitStatus>) return "exit status " + std::to_string(x.code);
        else if constexpr (std::is_same_v<T, NoStatus>) return "no exit status";
        else return std::string(toCStr(x.kind)) + ": " + x.description;
    }, r);
}
