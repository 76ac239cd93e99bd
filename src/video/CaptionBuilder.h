#pragma once

#include "config/ComposerConfig.h"
#include <string>
#include <vector>

namespace SceneStitch {

// Word-boundary wrap; words are never cut, a single over-long word gets its own line.
std::vector<std::string> wrapCaptionText(const std::string& text, size_t maxChars);

// Escape a line for drawtext's text= option. Straight apostrophes become U+2019
// so the value can sit inside single quotes.
std::string escapeDrawtext(const std::string& text);

// Escape a literal value (such as a file path) for use as an unquoted filter
// option inside a filtergraph: both the option and the graph level.
std::string escapeFilterValue(const std::string& value);

/**
 * @brief Build the drawtext chain that burns narration into a scene
 *
 * For each wrapped line: depthLayers dark copies offset 2px per layer, then the
 * coloured main layer. Colours cycle through the palette per line.
 *
 * @return Comma-joined filters ready to append to a video chain, or an empty
 *         string when captions are disabled or the text is blank
 */
std::string buildCaptionFilters(const std::string& text, const CaptionStyle& style);

} // namespace SceneStitch
