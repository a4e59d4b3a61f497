/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/logger.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <exception>

namespace debridarr {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;
static std::ofstream g_log_file;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = parseEnvLevel();
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

bool Logger::setLogFile(const std::filesystem::path& path) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (g_log_file.is_open()) {
            g_log_file.close();
        }
        if (path.empty()) {
            return true;
        }
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        g_log_file.open(path, std::ios::app);
        return g_log_file.is_open();
    } catch (const std::exception&) {
        return false;
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string thread_info = threadName();
        if (thread_info.empty()) {
            std::ostringstream oss;
            oss << "T" << std::this_thread::get_id();
            thread_info = oss.str();
        }

        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message;
        const std::string line = ss.str();

        {
            // stdout is reserved for the job status lines
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << line << std::endl;
            if (g_log_file.is_open()) {
                g_log_file << line << '\n';
                g_log_file.flush();
            }
        }
    } catch (const std::exception&) {
        // Never throw from logging - would cause infinite loops
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("DEBRIDARR_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

std::string threadName() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    auto it = g_thread_names.find(std::this_thread::get_id());
    return it != g_thread_names.end() ? it->second : std::string();
}

}
