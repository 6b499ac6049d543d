#include "Log.h"

#include <atomic>
#include <iostream>
#include <mutex>

static std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

static std::atomic<bool> verbose{false};

void logInfo(const std::string& tag, const std::string& text) {
    std::lock_guard<std::mutex> lk(logMutex());
    std::cout << "[" << tag << "] " << text << std::endl;
}

void logError(const std::string& tag, const std::string& text) {
    std::lock_guard<std::mutex> lk(logMutex());
    std::cerr << "[" << tag << " ERROR] " << text << std::endl;
}

void setVerbose(bool on) {
    verbose = on;
}

void logDebug(const std::string& tag, const std::string& text) {
    if (!verbose) return;
    logInfo(tag, text);
}

void writeStdoutLine(const std::string& line) {
    std::lock_guard<std::mutex> lk(logMutex());
    std::cout << line << std::endl;
}
