// LauncherConfig
// - JSON-Override der einkompilierten Interpreter-Optionen (nlohmann::json).
// - Unbekannte Schlüssel werden ignoriert, falsche Typen sind ein Fehler: eine kaputte
//   Konfiguration soll den Start abbrechen und nicht stillschweigend Defaults nehmen.
#include "LauncherConfig.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
bool readString(const json& j, const char* key, std::string& out, std::string& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) { err = std::string("'") + key + "' must be a string"; return false; }
    out = j[key].get<std::string>();
    return true;
}
bool readBool(const json& j, const char* key, bool& out, std::string& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) { err = std::string("'") + key + "' must be a boolean"; return false; }
    out = j[key].get<bool>();
    return true;
}
}

std::vector<std::string> LauncherConfig::resolvedPackageRoots() const {
    std::vector<std::string> out;
    out.reserve(packageRoots.size());
    for (const auto& r : packageRoots) {
        fs::path p(r);
        if (p.is_relative() && !baseDir.empty()) p = baseDir / p;
        out.push_back(p.lexically_normal().string());
    }
    return out;
}

bool applyLauncherConfigJson(const json& j, LauncherConfig& cfg, std::string& err) {
    if (!j.is_object()) { err = "config root must be a JSON object"; return false; }

    LauncherConfig next = cfg;
    if (!readString(j, "module",         next.module,         err)) return false;
    if (!readString(j, "entryPoint",     next.entryPoint,     err)) return false;
    if (!readString(j, "pythonHome",     next.pythonHome,     err)) return false;
    if (!readBool  (j, "siteImport",     next.siteImport,     err)) return false;
    if (!readBool  (j, "printTraceback", next.printTraceback, err)) return false;

    if (next.module.empty())     { err = "'module' must not be empty";     return false; }
    if (next.entryPoint.empty()) { err = "'entryPoint' must not be empty"; return false; }

    if (j.contains("packageRoots")) {
        const auto& arr = j["packageRoots"];
        if (!arr.is_array()) { err = "'packageRoots' must be an array of strings"; return false; }
        next.packageRoots.clear();
        for (const auto& it : arr) {
            if (!it.is_string()) { err = "'packageRoots' must be an array of strings"; return false; }
            next.packageRoots.push_back(it.get<std::string>());
        }
    }

    if (j.contains("environment")) {
        const auto& env = j["environment"];
        if (!env.is_object()) { err = "'environment' must be an object of strings"; return false; }
        next.environment.clear();
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().is_string()) {
                err = "'environment." + it.key() + "' must be a string";
                return false;
            }
            next.environment[it.key()] = it.value().get<std::string>();
        }
    }

    if (j.contains("logLevel")) {
        if (!j["logLevel"].is_string()
            || !Logger::parseLevel(j["logLevel"].get<std::string>(), next.logLevel)) {
            err = "'logLevel' must be one of error, warn, info, debug";
            return false;
        }
    }

    cfg = std::move(next);
    return true;
}

bool loadLauncherConfig(const fs::path& file, LauncherConfig& cfg, std::string& err) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        logAt(Logger::LogLevel::Debug) << "no config at " << file.string() << ", using defaults\n";
        return true;
    }

    std::ifstream ifs(file);
    if (!ifs.is_open()) { err = "cannot open " + file.string(); return false; }

    json j;
    try {
        j = json::parse(ifs);
    } catch (const json::parse_error& e) {
        err = file.string() + ": " + e.what();
        return false;
    }
    if (!applyLauncherConfigJson(j, cfg, err)) {
        err = file.string() + ": " + err;
        return false;
    }
    logAt(Logger::LogLevel::Debug) << "config loaded from " << file.string() << "\n";
    return true;
}

void applyEnvironmentDefaults(const std::map<std::string, std::string>& env) {
    for (const auto& [name, value] : env) {
#if defined(_WIN32)
        size_t len = 0;
        if (getenv_s(&len, nullptr, 0, name.c_str()) == 0 && len == 0)
            _putenv_s(name.c_str(), value.c_str());
#else
        if (::setenv(name.c_str(), value.c_str(), /*overwrite*/0) != 0)
            logAt(Logger::LogLevel::Warn) << "setenv(" << name << ") failed\n";
#endif
    }
}

fs::path executablePath() {
#if defined(_WIN32)
    std::wstring buffer(260, L'\0');
    for (;;) {
        DWORD len = ::GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (len == 0) return {};
        if (len < buffer.size() - 1) { buffer.resize(len); return fs::path(buffer); }
        buffer.resize(buffer.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buffer(size, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) return {};
    buffer.resize(std::strlen(buffer.c_str()));
    std::error_code ec;
    fs::path resolved = fs::canonical(buffer, ec);
    return ec ? fs::path(buffer) : resolved;
#else
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::path{} : self;
#endif
}

fs::path executableDir(const char* argv0) {
    const fs::path self = executablePath();
    if (!self.empty()) return self.parent_path();

    // letzter Ausweg: argv0 (bei Start über PATH nur der nackte Name)
    std::error_code ec;
    if (argv0 && *argv0) {
        fs::path p = fs::absolute(argv0, ec);
        if (!ec) return p.parent_path();
    }
    return fs::current_path(ec);
}
