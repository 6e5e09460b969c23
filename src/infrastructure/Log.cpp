/**
 * @file Log.cpp
 * @brief Implementation of Log.
 */

#include "infrastructure/Log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace pdfcatalog::infrastructure {

namespace {

std::mutex g_logMutex;
std::atomic<bool> g_quiet{false};

} // namespace

void Log::Info(const std::string& component, const std::string& message) {
    if (g_quiet) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cout << "[" << component << "] " << message << std::endl;
}

void Log::Warn(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << "[" << component << "] Warning: " << message << std::endl;
}

void Log::Error(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << "[" << component << "] Error: " << message << std::endl;
}

void Log::SetQuiet(bool quiet) {
    g_quiet = quiet;
}

bool Log::IsQuiet() {
    return g_quiet;
}

} // namespace pdfcatalog::infrastructure
