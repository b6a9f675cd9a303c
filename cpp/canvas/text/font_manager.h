#ifndef ARTCHIVE_CANVAS_TEXT_FONT_MANAGER_H
#define ARTCHIVE_CANVAS_TEXT_FONT_MANAGER_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace canvas::text {

// Design-unit metrics of a face; getScaledMetrics() converts to a font size.
struct FontMetrics {
    float unitsPerEM{1000.0f};
    float ascender{800.0f};
    float descender{-200.0f};
    float lineGap{0.0f};
};

/**
 * FontHandle: a loaded face with its HarfBuzz font. The font bytes stay owned
 * by the handle because FreeType reads them lazily.
 */
struct FontHandle {
    std::uint32_t id{0};
    std::string familyName;
    bool bold{false};
    bool italic{false};

    FT_Face ftFace{nullptr};
    hb_font_t* hbFont{nullptr};

    FontMetrics metrics;
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and every loaded face.
 *
 * Faces are registered under a family name (case-insensitive) so text objects
 * can resolve their CSS `fontFamily` plus bold/italic style to a face. Unknown
 * families resolve to the default font, which is the first one loaded.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    bool initialize();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Loading
    // =========================================================================

    /**
     * Load a TTF/OTF font from memory. The bytes are copied.
     * @param familyName Family to register under; the face's own name if empty
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = "",
        bool bold = false,
        bool italic = false
    );

    // Primarily for tests and native tools. Returns 0 on failure.
    std::uint32_t loadFontFromFile(
        const std::string& filePath,
        const std::string& familyName = "",
        bool bold = false,
        bool italic = false
    );

    bool unloadFont(std::uint32_t fontId);

    // =========================================================================
    // Lookup
    // =========================================================================

    // fontId 0 means the default font.
    const FontHandle* getFont(std::uint32_t fontId) const;
    bool hasFont(std::uint32_t fontId) const;

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }

    /**
     * Resolve a family and style to a font id. Prefers the exact style, then
     * the family's regular face, then any face of the family, then the default.
     * @return Font ID, or 0 when nothing is loaded
     */
    std::uint32_t resolveFont(std::string_view familyName, bool bold, bool italic) const;

    std::vector<std::string> getFamilies() const;

    // =========================================================================
    // Metrics
    // =========================================================================

    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

    // Sets the FreeType char size and HarfBuzz scale (26.6 fixed point).
    bool setFontSize(std::uint32_t fontId, float fontSize);

private:
    FontHandle* getFontMutable(std::uint32_t fontId);

    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName,
        bool bold,
        bool italic
    );

    FontMetrics extractMetrics(FT_Face face) const;
    static void destroyHandle(FontHandle& handle);

    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    // Lowercased family name -> font ids in load order
    std::unordered_map<std::string, std::vector<std::uint32_t>> familyMap_;

    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
};

} // namespace canvas::text

#endif // ARTCHIVE_CANVAS_TEXT_FONT_MANAGER_H
