#ifndef ARTCHIVE_CANVAS_TEXT_TEXT_MEASURE_H
#define ARTCHIVE_CANVAS_TEXT_TEXT_MEASURE_H

#include "canvas/core/types.h"
#include "canvas/text/font_manager.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations
typedef struct hb_buffer_t hb_buffer_t;

namespace canvas::text {

struct MeasuredLine {
    std::string text;
    float width{0.0f};
};

struct TextMeasurement {
    std::vector<MeasuredLine> lines;
    float width{0.0f};  // widest line
    float height{0.0f}; // lines * lineHeight
    float lineHeight{0.0f};
    std::uint32_t fontId{0}; // 0 when advances were estimated
};

/**
 * TextMeasurer: shapes text with HarfBuzz and breaks it into lines.
 *
 * Lines break at explicit '\n' and, when a wrap width is given, greedily at
 * spaces. A word wider than the wrap width gets a line of its own. When no
 * font is available advances fall back to fontSize * 0.6 per codepoint so
 * layout stays deterministic.
 */
class TextMeasurer {
public:
    explicit TextMeasurer(FontManager& fontManager);
    ~TextMeasurer();

    TextMeasurer(const TextMeasurer&) = delete;
    TextMeasurer& operator=(const TextMeasurer&) = delete;

    // Advance width of a single line of text.
    float measureRun(std::string_view content, std::uint32_t fontId, float fontSize);

    TextMeasurement measure(
        std::string_view content,
        std::string_view fontFamily,
        float fontSize,
        std::optional<float> wrapWidth,
        bool bold = false,
        bool italic = false);

    // Uses the shape's family, size, wrap width and fontStyle.
    TextMeasurement measure(const TextShape& shape);

    FontManager& fontManager() { return fontManager_; }

private:
    float shapeAdvance(std::string_view content, const FontHandle& font);
    void wrapParagraph(
        std::string_view paragraph,
        std::uint32_t fontId,
        float fontSize,
        std::optional<float> wrapWidth,
        std::vector<MeasuredLine>& out);

    FontManager& fontManager_;
    hb_buffer_t* hbBuffer_ = nullptr;
};

// Parses a CSS-like fontStyle ("bold", "italic", "bold italic", "normal").
void parseFontStyle(std::string_view fontStyle, bool& bold, bool& italic);

} // namespace canvas::text

#endif // ARTCHIVE_CANVAS_TEXT_TEXT_MEASURE_H
