#include "CaptionBuilder.h"
#include <filesystem>
#include <sstream>

namespace SceneStitch {

std::vector<std::string> wrapCaptionText(const std::string& text, size_t maxChars) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word;
    std::string current;
    while (words >> word) {
        if (!current.empty() && current.size() + 1 + word.size() > maxChars) {
            lines.push_back(current);
            current = word;
        } else {
            current = current.empty() ? word : current + " " + word;
        }
    }
    if (!current.empty()) lines.push_back(current);
    return lines;
}

std::string escapeDrawtext(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\'': out += "\xE2\x80\x99"; break;
        case ':': out += "\\:"; break;
        case '%': out += "%%"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string escapeFilterValue(const std::string& value) {
    // Option level, then filtergraph level
    std::string option;
    for (char c : value) {
        if (c == '\\' || c == '\'' || c == ':') option += '\\';
        option += c;
    }
    std::string graph;
    for (char c : option) {
        if (c == '\\' || c == '\'' || c == '[' || c == ']' || c == ',' || c == ';') graph += '\\';
        graph += c;
    }
    return graph;
}

std::string buildCaptionFilters(const std::string& text, const CaptionStyle& style) {
    if (!style.enabled) return "";
    std::vector<std::string> lines = wrapCaptionText(text, style.maxCharsPerLine);
    if (lines.empty()) return "";

    std::string fontOpt = "fontsize=" + std::to_string(style.fontSize);
    std::error_code ec;
    if (!style.fontPath.empty() && std::filesystem::exists(style.fontPath, ec)) {
        std::string font = style.fontPath;
        for (auto& c : font) {
            if (c == '\\') c = '/';
        }
        fontOpt += ":fontfile=" + escapeFilterValue(font);
    }

    const int n = static_cast<int>(lines.size());
    const int lineHeight = style.fontSize + style.lineSpacing;

    std::ostringstream anchor;
    anchor << "(h*" << style.anchor << ")";

    std::vector<std::string> filters;
    for (int i = 0; i < n; ++i) {
        const std::string safe = escapeDrawtext(lines[i]);
        const std::string& color = style.palette.empty()
            ? std::string("white")
            : style.palette[static_cast<size_t>(i) % style.palette.size()];

        // top of line i with the block centred on the anchor
        int offset = i * lineHeight - (n * lineHeight) / 2;
        std::string y = anchor.str() + (offset >= 0 ? "+" : "-") + std::to_string(offset >= 0 ? offset : -offset);

        for (int d = style.depthLayers; d > 0; --d) {
            std::ostringstream f;
            f << "drawtext=" << fontOpt << ":text='" << safe << "'"
              << ":fontcolor=0x1a0a00@0.85:borderw=3:bordercolor=black"
              << ":x=(w-text_w)/2+" << d * 2
              << ":y=(" << y << ")+" << d * 2;
            filters.push_back(f.str());
        }

        std::ostringstream main;
        main << "drawtext=" << fontOpt << ":text='" << safe << "'"
             << ":fontcolor=" << color << ":borderw=4:bordercolor=black"
             << ":shadowcolor=black@0.6:shadowx=2:shadowy=2"
             << ":x=(w-text_w)/2:y=" << y;
        filters.push_back(main.str());
    }

    std::string joined;
    for (size_t i = 0; i < filters.size(); ++i) {
        if (i) joined += ",";
        joined += filters[i];
    }
    return joined;
}

} // namespace SceneStitch
