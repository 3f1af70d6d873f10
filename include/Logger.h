// Logger – Level-basiertes Logging des Launchers
//
// log(lvl) liefert einen ostream, der entweder mit "[clipfix][INF] " geprefixt auf
// std::cerr zeigt oder – falls das Level deaktiviert ist – auf einen Null-Stream.
// std::cout gehört dem eingebetteten Programm, der Launcher schreibt deshalb ausschließlich nach stderr.
#pragma once
#include <atomic>
#include <ostream>
#include <string>

class Logger {
public:
    enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3 };

    static Logger& instance() {
        static Logger l;
        return l;
    }

    void setLogLevel(LogLevel lvl) { logLevel_.store(static_cast<int>(lvl), std::memory_order_relaxed); }
    bool isEnabled(LogLevel lvl) const { return static_cast<int>(lvl) <= logLevel_.load(std::memory_order_relaxed); }

    std::ostream& log(LogLevel lvl) const;

    static const char* toCStr(LogLevel lvl);
    // "error" | "warn" | "info" | "debug" (case-insensitive); false bei unbekanntem Namen
    static bool parseLevel(const std::string& name, LogLevel& out);

private:
    Logger() = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<int> logLevel_{static_cast<int>(LogLevel::Warn)};
};

// Kurzform: logAt(Logger::LogLevel::Info) << "..." << "\n";
inline std::ostream& logAt(Logger::LogLevel lvl) { return Logger::instance().log(lvl); }
