#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace SceneStitch {

// Root of every failure that aborts a composition run. Nothing below the run
// boundary swallows these; the only local recovery is the renderer's single
// alternate-source retry.
class CompositionError : public std::runtime_error {
public:
    explicit CompositionError(const std::string& what) : std::runtime_error(what) {}
};

// Unreadable or corrupt source material
class DecodeError : public CompositionError {
public:
    explicit DecodeError(const std::string& what) : CompositionError(what) {}
};

class AudioDecodeError : public DecodeError {
public:
    AudioDecodeError(size_t sceneIndex, const std::string& what)
        : DecodeError("scene " + std::to_string(sceneIndex) + ": audio decode failed: " + what)
        , m_sceneIndex(sceneIndex) {}

    size_t sceneIndex() const { return m_sceneIndex; }

private:
    size_t m_sceneIndex;
};

class SourceDecodeError : public DecodeError {
public:
    SourceDecodeError(const std::string& path, const std::string& what)
        : DecodeError("video source decode failed (" + path + "): " + what)
        , m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// A required source is absent
class MissingAssetError : public CompositionError {
public:
    explicit MissingAssetError(const std::string& what) : CompositionError(what) {}
};

class MissingAvatarAsset : public MissingAssetError {
public:
    explicit MissingAvatarAsset(const std::string& path)
        : MissingAssetError("avatar clip not found: " + (path.empty() ? std::string("<unset>") : path)) {}
};

// Computed spans broke an exactness invariant. Always a logic bug.
class TimingViolationError : public CompositionError {
public:
    explicit TimingViolationError(const std::string& what) : CompositionError(what) {}
};

class TransitionOverlapError : public CompositionError {
public:
    explicit TransitionOverlapError(const std::string& what) : CompositionError(what) {}
};

class ExportFailed : public CompositionError {
public:
    ExportFailed(const std::string& what, int exitStatus)
        : CompositionError(what + " (exit status " + std::to_string(exitStatus) + ")")
        , m_exitStatus(exitStatus) {}

    int exitStatus() const { return m_exitStatus; }

private:
    int m_exitStatus;
};

class ConfigurationError : public CompositionError {
public:
    explicit ConfigurationError(const std::string& what) : CompositionError(what) {}
};

} // namespace SceneStitch
