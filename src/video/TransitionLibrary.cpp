#include "TransitionLibrary.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace SceneStitch {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

TransitionLibrary::TransitionLibrary() {
    m_transitions = {
        {TransitionKind::CrossFade, "fade", "fade"},
        {TransitionKind::Wipe, "wipe", "wipeleft"},
        {TransitionKind::Slide, "slide", "slideleft"},
    };
}

const TransitionEffect* TransitionLibrary::findByName(const std::string& name) const {
    std::string key = toLower(name);
    // trim whitespace
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.front()))) key.erase(key.begin());
    while (!key.empty() && std::isspace(static_cast<unsigned char>(key.back()))) key.pop_back();

    if (key == "crossfade" || key == "cross-fade" || key == "dissolve") {
        key = "fade";
    }
    for (const auto& t : m_transitions) {
        if (t.name == key || t.xfadeName == key) return &t;
    }
    return nullptr;
}

const TransitionEffect* TransitionLibrary::findByKind(TransitionKind kind) const {
    for (const auto& t : m_transitions) {
        if (t.kind == kind) return &t;
    }
    return nullptr;
}

std::string TransitionLibrary::buildXfadeFilter(TransitionKind kind, MediaTime duration, MediaTime offset) const {
    const TransitionEffect* t = findByKind(kind);
    if (!t) return "";

    std::ostringstream oss;
    oss << "xfade=transition=" << t->xfadeName
        << ":duration=" << formatSeconds(duration)
        << ":offset=" << formatSeconds(offset);
    return oss.str();
}

std::string TransitionLibrary::buildAcrossfadeFilter(MediaTime duration) const {
    return "acrossfade=d=" + formatSeconds(duration);
}

const char* TransitionLibrary::kindName(TransitionKind kind) {
    switch (kind) {
    case TransitionKind::CrossFade: return "fade";
    case TransitionKind::Wipe: return "wipe";
    case TransitionKind::Slide: return "slide";
    }
    return "fade";
}

} // namespace SceneStitch
