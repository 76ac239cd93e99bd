#include "Exporter.h"
#include "pipeline/CompositionErrors.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include <condition_variable>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <set>
#include <sstream>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/locking.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace SceneStitch {

static std::mutex s_lockRegistryMutex;
static std::condition_variable s_lockReleased;
static std::set<std::string> s_lockedOutputs;
static size_t s_waiting = 0;

static std::string lockKey(const std::string& outputPath) {
    std::error_code ec;
    std::filesystem::path p = std::filesystem::weakly_canonical(std::filesystem::absolute(outputPath, ec), ec);
    if (ec) return outputPath;
    return p.string();
}

OutputPathLock::OutputPathLock(const std::string& outputPath)
    : m_key(lockKey(outputPath))
    , m_lockPath(outputPath + ".lock")
{
    {
        std::unique_lock<std::mutex> lk(s_lockRegistryMutex);
        if (s_lockedOutputs.count(m_key)) {
            DebugLogger::getInstance().log("[Exporter] waiting for another export to " + outputPath);
            ++s_waiting;
            s_lockReleased.wait(lk, [this] { return s_lockedOutputs.count(m_key) == 0; });
            --s_waiting;
        }
        s_lockedOutputs.insert(m_key);
    }

    try {
        lockFile();
    } catch (const ExportFailed&) {
        std::lock_guard<std::mutex> lk(s_lockRegistryMutex);
        s_lockedOutputs.erase(m_key);
        s_lockReleased.notify_all();
        throw;
    }
}

OutputPathLock::~OutputPathLock() {
    unlockFile();
    std::lock_guard<std::mutex> lk(s_lockRegistryMutex);
    s_lockedOutputs.erase(m_key);
    s_lockReleased.notify_all();
}

size_t OutputPathLock::waitingCount() {
    std::lock_guard<std::mutex> lk(s_lockRegistryMutex);
    return s_waiting;
}

#ifdef _WIN32

void OutputPathLock::lockFile() {
    m_fd = _open(m_lockPath.c_str(), _O_RDWR | _O_CREAT, _S_IREAD | _S_IWRITE);
    if (m_fd < 0) {
        throw ExportFailed("could not open lock file " + m_lockPath, -1);
    }
    // _LK_LOCK gives up after ten one-second attempts
    while (_locking(m_fd, _LK_LOCK, 1) != 0) {
        if (errno != EDEADLOCK) {
            _close(m_fd);
            m_fd = -1;
            throw ExportFailed("could not lock " + m_lockPath, -1);
        }
    }
}

void OutputPathLock::unlockFile() {
    if (m_fd < 0) return;
    _lseek(m_fd, 0, SEEK_SET);
    _locking(m_fd, _LK_UNLCK, 1);
    _close(m_fd);
    m_fd = -1;
    // Fails while another process has the file open; that holder removes it later
    std::error_code ec;
    if (!std::filesystem::remove(m_lockPath, ec) && ec) {
        DebugLogger::getInstance().log("[Exporter] lock file " + m_lockPath + " left in place: " + ec.message());
    }
}

#else

void OutputPathLock::lockFile() {
    for (;;) {
        int fd = ::open(m_lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw ExportFailed("could not open lock file " + m_lockPath + ": " + std::strerror(errno), -1);
        }
        int rc;
        do {
            rc = ::flock(fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd);
            throw ExportFailed("could not lock " + m_lockPath + ": " + std::strerror(err), -1);
        }

        // The previous holder unlinks the file on release; lock again if ours is gone
        struct stat held;
        struct stat current;
        if (::fstat(fd, &held) == 0 && ::stat(m_lockPath.c_str(), &current) == 0
            && held.st_dev == current.st_dev && held.st_ino == current.st_ino) {
            m_fd = fd;
            return;
        }
        ::close(fd);
    }
}

void OutputPathLock::unlockFile() {
    if (m_fd < 0) return;
    // Unlink while still holding the lock so a waiter re-checks the inode
    if (::unlink(m_lockPath.c_str()) != 0 && errno != ENOENT) {
        DebugLogger::getInstance().log("[Exporter] could not remove lock file " + m_lockPath + ": "
                                       + std::strerror(errno));
    }
    ::close(m_fd);
    m_fd = -1;
}

#endif

Exporter::Exporter(const ComposerConfig& config, MediaTool& tool)
    : m_config(config)
    , m_tool(tool)
{
}

std::string Exporter::partialPath(const std::string& outputPath) {
    return outputPath + ".partial.mp4";
}

MediaJob Exporter::buildJob(const FinalTimeline& timeline, const std::string& destination) const {
    MediaJob job;
    job.label = "export";
    job.outputPath = destination;

    const size_t n = timeline.clips.size();
    for (const auto& clip : timeline.clips) {
        job.args.push_back("-i");
        job.args.push_back(clip.path);
    }

    std::ostringstream frame;
    frame << "scale=" << m_config.frameWidth << ":" << m_config.frameHeight << ",setsar=1,format=yuv420p";

    std::ostringstream fc;
    std::string videoLabel = "[0:v]";
    std::string audioLabel = "[0:a]";
    for (size_t i = 1; i < n; ++i) {
        const Transition& t = timeline.transitions[i - 1];
        std::string vOut = "[vx" + std::to_string(i) + "]";
        std::string aOut = "[ax" + std::to_string(i) + "]";
        fc << videoLabel << "[" << i << ":v]"
           << m_library.buildXfadeFilter(t.kind, t.overlap, t.offset) << vOut << ";";
        fc << audioLabel << "[" << i << ":a]"
           << m_library.buildAcrossfadeFilter(t.overlap) << aOut << ";";
        videoLabel = vOut;
        audioLabel = aOut;
    }
    fc << videoLabel << frame.str() << "[vout];";
    fc << audioLabel << "anull[aout]";

    const std::vector<std::string> tail = {
        "-filter_complex", fc.str(),
        "-map", "[vout]",
        "-map", "[aout]",
        "-c:v", m_config.videoCodec,
        "-preset", m_config.preset,
        "-crf", std::to_string(m_config.crf),
        "-pix_fmt", "yuv420p",
        "-r", std::to_string(m_config.frameRate),
        "-c:a", m_config.audioCodec,
        "-b:a", m_config.audioBitrate,
        "-ar", std::to_string(m_config.audioSampleRate),
        "-movflags", "+faststart",
        "-f", "mp4",
        "-y", destination
    };
    job.args.insert(job.args.end(), tail.begin(), tail.end());
    return job;
}

void Exporter::exportTimeline(const FinalTimeline& timeline, const std::string& outputPath) const {
    TRACE_SCOPE("Exporter::exportTimeline");
    auto& logger = DebugLogger::getInstance();

    if (timeline.clips.empty()) {
        throw ExportFailed("nothing to export to " + outputPath, -1);
    }
    if (timeline.transitions.size() + 1 != timeline.clips.size()) {
        throw TimingViolationError("final timeline has " + std::to_string(timeline.clips.size()) + " clips but "
                                   + std::to_string(timeline.transitions.size()) + " transitions");
    }

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(outputPath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw ExportFailed("could not create output directory " + parent.string() + ": " + ec.message(), -1);
        }
    }

    OutputPathLock lock(outputPath);
    const std::string partial = partialPath(outputPath);
    std::filesystem::remove(partial, ec);

    MediaJob job = buildJob(timeline, partial);
    logger.log("[Exporter] exporting " + std::to_string(timeline.clips.size()) + " clip(s), "
               + std::to_string(timeline.transitions.size()) + " transition(s), expected "
               + formatSeconds(timeline.totalDuration()) + "s -> " + outputPath);

    ToolResult result = m_tool.run(job);
    if (!result.ok()) {
        std::filesystem::remove(partial, ec);
        throw ExportFailed("export to " + outputPath + " failed", result.exitStatus);
    }
    if (!std::filesystem::exists(partial, ec)) {
        throw ExportFailed("export tool reported success but wrote no file for " + outputPath, result.exitStatus);
    }

    std::filesystem::rename(partial, outputPath, ec);
    if (ec) {
        std::error_code rmEc;
        std::filesystem::remove(partial, rmEc);
        throw ExportFailed("could not move export into place at " + outputPath + ": " + ec.message(), -1);
    }
    logger.log("[Exporter] wrote " + outputPath);
}

} // namespace SceneStitch
