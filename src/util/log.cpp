#include <cstdlib>
#include <vector>

#include "util/log.h"
#include "util/timer.h"

int Log::verbosity = Log::V2_INFORMATION;
bool Log::coloredOutput = false;
bool Log::forcePrint = false;
FILE* Log::logFile = nullptr;

void Log::init(int verbosity, bool coloredOutput, const std::string& logFilePath) {
    Log::verbosity = verbosity;
    Log::coloredOutput = coloredOutput;
    close();
    if (!logFilePath.empty()) {
        logFile = fopen(logFilePath.c_str(), "w");
        if (logFile == nullptr) w("Cannot open log file %s\n", logFilePath.c_str());
        else atexit(Log::close);
    }
}

void Log::close() {
    if (logFile != nullptr) {
        fclose(logFile);
        logFile = nullptr;
    }
}

void Log::setForcePrint(bool force) {
    forcePrint = force;
}

int Log::getVerbosity() {
    return verbosity;
}

bool Log::isEnabled(int verb) {
    return forcePrint || verb <= verbosity;
}

#define DOCKPLAN_LOG_FORWARD(verb, withTime) \
    va_list vl; \
    va_start(vl, str); \
    write(verb, withTime, str, vl); \
    va_end(vl); \
    return false;

bool Log::d(const char* str, ...) {DOCKPLAN_LOG_FORWARD(V4_DEBUG, true)}
bool Log::v(const char* str, ...) {DOCKPLAN_LOG_FORWARD(V3_VERBOSE, true)}
bool Log::i(const char* str, ...) {DOCKPLAN_LOG_FORWARD(V2_INFORMATION, true)}
bool Log::w(const char* str, ...) {DOCKPLAN_LOG_FORWARD(V1_WARNINGS, true)}
bool Log::e(const char* str, ...) {DOCKPLAN_LOG_FORWARD(V0_ESSENTIAL, true)}

bool Log::log_notime(int verb, const char* str, ...) {DOCKPLAN_LOG_FORWARD(verb, false)}

#undef DOCKPLAN_LOG_FORWARD

bool Log::write(int verb, bool withTime, const char* str, va_list& vl) {

    if (!isEnabled(verb)) return false;

    // Format once, print to the terminal and to the log file
    va_list copy;
    va_copy(copy, vl);
    int len = vsnprintf(nullptr, 0, str, copy);
    va_end(copy);
    if (len < 0) return false;
    std::vector<char> msg(len+1);
    vsnprintf(msg.data(), msg.size(), str, vl);

    char time[32] = "";
    if (withTime) snprintf(time, sizeof(time), "%.3f ", Timer::elapsedSeconds());

    if (coloredOutput) {
        static const Modifier gray(FG_DARK_GRAY);
        static const Modifier reset(FG_DEFAULT);
        printf("%s%s%s%s%s", gray.str(), time, colorOf(verb), msg.data(), reset.str());
    } else {
        printf("%s%s", time, msg.data());
    }
    if (verb <= V1_WARNINGS) fflush(stdout);

    if (logFile != nullptr) {
        fprintf(logFile, "%s%s", time, msg.data());
        if (verb <= V1_WARNINGS) fflush(logFile);
    }
    return false;
}

const char* Log::colorOf(int verb) {
    static const Modifier red(FG_LIGHT_RED);
    static const Modifier yellow(FG_YELLOW);
    static const Modifier white(FG_WHITE);
    static const Modifier gray(FG_DARK_GRAY);
    switch (verb) {
    case V0_ESSENTIAL: return red.str();
    case V1_WARNINGS: return yellow.str();
    case V2_INFORMATION: return white.str();
    default: return gray.str();
    }
}
