#include "canvas/text/text_measure.h"

#include "canvas/core/string_utils.h"

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>

namespace canvas::text {

namespace {

float estimateAdvance(std::string_view content, float fontSize) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t len = 0;
        decodeUtf8Codepoint(content, pos, len);
        pos += len == 0 ? 1 : len;
        count++;
    }
    return static_cast<float>(count) * fontSize * kTextCharWidthFactor;
}

} // namespace

void parseFontStyle(std::string_view fontStyle, bool& bold, bool& italic) {
    bold = false;
    italic = false;
    std::size_t pos = 0;
    while (pos < fontStyle.size()) {
        while (pos < fontStyle.size() && isAsciiSpace(fontStyle[pos])) pos++;
        std::size_t end = pos;
        while (end < fontStyle.size() && !isAsciiSpace(fontStyle[end])) end++;
        const std::string_view token = fontStyle.substr(pos, end - pos);
        if (!token.empty()) {
            if (startsWithIgnoreCase(token, "bold") && token.size() == 4) bold = true;
            if (startsWithIgnoreCase(token, "italic") && token.size() == 6) italic = true;
            if (startsWithIgnoreCase(token, "oblique") && token.size() == 7) italic = true;
        }
        pos = end;
    }
}

TextMeasurer::TextMeasurer(FontManager& fontManager)
    : fontManager_(fontManager) {
    hbBuffer_ = hb_buffer_create();
}

TextMeasurer::~TextMeasurer() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

float TextMeasurer::shapeAdvance(std::string_view content, const FontHandle& font) {
    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, content.data(), static_cast<int>(content.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);
    hb_shape(font.hbFont, hbBuffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!positions) return 0.0f;

    // HarfBuzz positions are 26.6 fixed point.
    hb_position_t advance = 0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        advance += positions[i].x_advance;
    }
    return static_cast<float>(advance) / 64.0f;
}

float TextMeasurer::measureRun(std::string_view content, std::uint32_t fontId, float fontSize) {
    if (content.empty() || !(fontSize > 0.0f)) return 0.0f;

    const FontHandle* font = fontId != 0 ? fontManager_.getFont(fontId) : nullptr;
    if (!font || !font->hbFont || !hbBuffer_ || !fontManager_.setFontSize(fontId, fontSize)) {
        return estimateAdvance(content, fontSize);
    }
    return shapeAdvance(content, *font);
}

void TextMeasurer::wrapParagraph(
    std::string_view paragraph,
    std::uint32_t fontId,
    float fontSize,
    std::optional<float> wrapWidth,
    std::vector<MeasuredLine>& out) {
    if (!wrapWidth || !(*wrapWidth > 0.0f)) {
        out.push_back(MeasuredLine{std::string(paragraph), measureRun(paragraph, fontId, fontSize)});
        return;
    }

    std::string current;
    float currentWidth = 0.0f;
    bool hasCurrent = false;
    std::size_t pos = 0;
    while (pos <= paragraph.size()) {
        std::size_t end = paragraph.find(' ', pos);
        if (end == std::string_view::npos) end = paragraph.size();
        const std::string_view word = paragraph.substr(pos, end - pos);
        pos = end + 1;
        if (word.empty() && end < paragraph.size()) continue;

        if (!hasCurrent) {
            current.assign(word.data(), word.size());
            currentWidth = measureRun(current, fontId, fontSize);
            hasCurrent = true;
            continue;
        }

        std::string candidate = current;
        candidate.push_back(' ');
        candidate.append(word.data(), word.size());
        const float candidateWidth = measureRun(candidate, fontId, fontSize);
        if (candidateWidth <= *wrapWidth) {
            current = std::move(candidate);
            currentWidth = candidateWidth;
        } else {
            out.push_back(MeasuredLine{std::move(current), currentWidth});
            current.assign(word.data(), word.size());
            currentWidth = measureRun(current, fontId, fontSize);
        }
    }
    out.push_back(MeasuredLine{std::move(current), currentWidth});
}

TextMeasurement TextMeasurer::measure(
    std::string_view content,
    std::string_view fontFamily,
    float fontSize,
    std::optional<float> wrapWidth,
    bool bold,
    bool italic) {
    TextMeasurement result{};
    result.lineHeight = fontSize * kTextLineHeightFactor;
    result.fontId = fontManager_.isInitialized() ? fontManager_.resolveFont(fontFamily, bold, italic) : 0;

    std::size_t start = 0;
    while (true) {
        const std::size_t newline = content.find('\n', start);
        const std::size_t end = newline == std::string_view::npos ? content.size() : newline;
        wrapParagraph(content.substr(start, end - start), result.fontId, fontSize, wrapWidth, result.lines);
        if (newline == std::string_view::npos) break;
        start = newline + 1;
    }

    for (const MeasuredLine& line : result.lines) {
        result.width = std::max(result.width, line.width);
    }
    result.height = static_cast<float>(result.lines.size()) * result.lineHeight;
    return result;
}

TextMeasurement TextMeasurer::measure(const TextShape& shape) {
    bool bold = false;
    bool italic = false;
    parseFontStyle(shape.fontStyle, bold, italic);
    return measure(shape.text, shape.fontFamily, shape.fontSize, shape.width, bold, italic);
}

} // namespace canvas::text
