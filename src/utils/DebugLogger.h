#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace SceneStitch {

// Thread-safe debug logging utility that writes to stderr and to
// <temp>/scenestitch_debug.log. Scene workers log through it concurrently.
class DebugLogger {
public:
    // Get the singleton instance
    static DebugLogger& getInstance();

    // Log a message (thread-safe)
    void log(const std::string& msg);

    // Path of the log file, empty if it could not be opened
    std::string getLogPath() const;

private:
    DebugLogger();
    ~DebugLogger();

    // Prevent copying
    DebugLogger(const DebugLogger&) = delete;
    DebugLogger& operator=(const DebugLogger&) = delete;

    mutable std::mutex mutex_;
    std::unique_ptr<std::ofstream> logFile_;
    std::string logPath_;
};

} // namespace SceneStitch
