#include "FFmpegTool.h"
#include "utils/DebugLogger.h"
#include "utils/ProcessUtils.h"
#include "tracing/Tracing.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace SceneStitch {

namespace {

std::string getTempDir() {
    std::error_code ec;
    std::filesystem::path td = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp/";
    }
    std::string tempDir = td.string();
    if (!tempDir.empty() && tempDir.back() != '/') {
        tempDir += '/';
    }
    return tempDir;
}

std::mutex g_logMutex;

// Capture FFmpeg command, exit code, and recent output.
void appendFfmpegLog(const std::string& label,
                     const std::string& command,
                     int exitCode,
                     const std::string& output) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    FILE* log = fopen((getTempDir() + "scenestitch_ffmpeg.log").c_str(), "a");
    if (!log) {
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf;
#ifdef _WIN32
    localtime_s(&tmBuf, &now);
#else
    localtime_r(&now, &tmBuf);
#endif
    char timeBuf[64] = {0};
    std::strftime(timeBuf, sizeof(timeBuf), "%c", &tmBuf);

    fprintf(log, "\n[%s] %s\n", timeBuf, label.c_str());
    fprintf(log, "cmd: %s\n", command.c_str());
    fprintf(log, "exit: %d\n", exitCode);

    // Only keep the tail of very long output
    const size_t maxTail = 4000;
    if (output.size() <= maxTail) {
        fprintf(log, "output:\n%s\n", output.c_str());
    } else {
        fprintf(log, "output (last %zu chars):\n%s\n", maxTail, output.substr(output.size() - maxTail).c_str());
    }

    fclose(log);
}

std::string writeFilterScript(const std::string& label, const std::string& graph) {
    static std::atomic<unsigned> counter{0};
    std::ostringstream name;
    name << getTempDir() << "scenestitch_filter_" << label << "_" << counter.fetch_add(1) << ".txt";

    std::ofstream out(name.str());
    if (!out) {
        return "";
    }
    out << graph;
    out.close();
    return out ? name.str() : "";
}

} // namespace

FFmpegTool::FFmpegTool(const std::string& ffmpegPath)
    : m_ffmpegPath(ffmpegPath)
{
}

std::string FFmpegTool::resolveFfmpegPath() const {
    return getFFmpegPath();
}

std::string FFmpegTool::getFFmpegPath() const {
    if (!m_ffmpegPath.empty()) {
        return m_ffmpegPath;
    }

    // 1. Environment variable
    const char* envPath = std::getenv("SCENESTITCH_FFMPEG_PATH");
    if (envPath != nullptr && envPath[0] != '\0') {
        return envPath;
    }

    // 2. PATH lookup
    std::string result;
#ifdef _WIN32
    int rc = runCommand("where ffmpeg", result);
#else
    int rc = runCommand("command -v ffmpeg", result);
#endif
    if (rc == 0) {
        size_t newline = result.find('\n');
        if (newline != std::string::npos) {
            result = result.substr(0, newline);
        }
        while (!result.empty() && (result.back() == '\r' || result.back() == ' ')) {
            result.pop_back();
        }
        if (!result.empty() && result.find("ffmpeg") != std::string::npos) {
            return result;
        }
    }

    // 3. Platform default
#ifdef _WIN32
    return "ffmpeg.exe";
#elif defined(__APPLE__)
    return "/opt/homebrew/bin/ffmpeg";
#else
    return "/usr/bin/ffmpeg";
#endif
}

ToolResult FFmpegTool::run(const MediaJob& job) {
    TRACE_SCOPE("FFmpegTool::run");
    ToolResult result;

    std::string scriptPath;
    std::ostringstream cmd;
    cmd << shellQuote(getFFmpegPath()) << " -hide_banner -nostdin";

    for (size_t i = 0; i < job.args.size(); ++i) {
        const std::string& arg = job.args[i];
        if (arg == "-filter_complex" && i + 1 < job.args.size() &&
            job.args[i + 1].size() > kMaxInlineFilterLength) {
            scriptPath = writeFilterScript(job.label, job.args[i + 1]);
            if (scriptPath.empty()) {
                result.exitStatus = -1;
                result.output = "Error: could not write filter script for " + job.label;
                appendFfmpegLog(job.label, cmd.str(), result.exitStatus, result.output);
                return result;
            }
            cmd << " -filter_complex_script " << shellQuote(scriptPath);
            ++i;
            continue;
        }
        cmd << " " << shellQuote(arg);
    }

    result.exitStatus = runCommand(cmd.str(), result.output);
    appendFfmpegLog(job.label, cmd.str(), result.exitStatus, result.output);

    if (!scriptPath.empty()) {
        std::error_code ec;
        std::filesystem::remove(scriptPath, ec);
    }

    if (!result.ok()) {
        DebugLogger::getInstance().log("[ffmpeg] " + job.label + " failed with exit " +
                                       std::to_string(result.exitStatus));
    }
    return result;
}

} // namespace SceneStitch
