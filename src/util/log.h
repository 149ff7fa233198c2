#ifndef DOCKPLAN_LOG_H
#define DOCKPLAN_LOG_H

#include <string>
#include <cstdarg>
#include <cstdio>

enum Code {
    FG_DEFAULT = 39, 
    FG_RED = 31, 
    FG_GREEN = 32, 
    FG_YELLOW = 33,
    FG_CYAN = 36, 
    FG_DARK_GRAY = 90, 
    FG_LIGHT_RED = 91, 
    FG_WHITE = 97
};

// ANSI escape sequence for a terminal color.
class Modifier {
private:
    std::string _str;
public:
    explicit Modifier(const Code& pCode) : _str("\033[" + std::to_string(pCode) + "m") {}
    const char* str() const {
        return _str.c_str();
    }
};

/*
 * printf-style logging with five verbosity levels. Each message of d/v/i/w/e
 * is prefixed with the seconds since Timer::init(). Messages can be mirrored
 * (without colors) into a log file.
 * All logging functions return false, so a call can be chained into an 
 * assertion: assert(cond || Log::e("...")).
 */
class Log {

public:
    static const int V0_ESSENTIAL = 0;
    static const int V1_WARNINGS = 1;
    static const int V2_INFORMATION = 2;
    static const int V3_VERBOSE = 3;
    static const int V4_DEBUG = 4;

private:
    static int verbosity;
    static bool coloredOutput;
    static bool forcePrint;
    static FILE* logFile;

public:
    static void init(int verbosity, bool coloredOutput, const std::string& logFilePath = "");
    static void close();
    static void setForcePrint(bool force);
    static int getVerbosity();
    static bool isEnabled(int verb);

    // Debug message
    static bool d(const char* str, ...);
    // Verbose info message
    static bool v(const char* str, ...);
    // Info message
    static bool i(const char* str, ...);
    // Warning
    static bool w(const char* str, ...);
    // Error
    static bool e(const char* str, ...);

    // Message without time prefix
    static bool log_notime(int verb, const char* str, ...);

private:
    static bool write(int verb, bool withTime, const char* str, va_list& vl);
    static const char* colorOf(int verb);
};

#endif
