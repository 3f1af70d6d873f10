#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <streambuf>

namespace {
struct NullBuf : public std::streambuf { int overflow(int c) override { return c; } };
NullBuf nb; std::ostream nullout_stream(&nb);
}

const char* Logger::toCStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "ERR";
        case LogLevel::Warn:  return "WRN";
        case LogLevel::Info:  return "INF";
        case LogLevel::Debug: return "DBG";
    }
    return "?";
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if (s == "info")  { out = LogLevel::Info;  return true; }
    if (s == "debug") { out = LogLevel::Debug; return true; }
    return false;
}

std::ostream& Logger::log(LogLevel lvl) const {
    if (isEnabled(lvl)) { std::cerr << "[clipfix][" << toCStr(lvl) << "] "; return std::cerr; }
    return nullout_stream;
}
