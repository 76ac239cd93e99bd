#include "DebugLogger.h"

#include <filesystem>
#include <iostream>

namespace SceneStitch {

DebugLogger& DebugLogger::getInstance() {
    static DebugLogger instance;
    return instance;
}

DebugLogger::DebugLogger() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = std::filesystem::current_path(ec);
    }

    std::string path = (dir / "scenestitch_debug.log").string();
    logFile_ = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (logFile_->is_open()) {
        *logFile_ << "[SceneStitch] Debug log started at " << path << std::endl;
        logPath_ = path;
    } else {
        logFile_.reset();
    }
}

DebugLogger::~DebugLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->close();
        logFile_.reset();
    }
}

void DebugLogger::log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << msg << std::endl;
    if (logFile_ && logFile_->is_open()) {
        *logFile_ << msg << std::endl;
    }
}

std::string DebugLogger::getLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logPath_;
}

} // namespace SceneStitch
