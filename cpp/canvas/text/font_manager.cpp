#include "canvas/text/font_manager.h"

#include "canvas/core/logging.h"
#include "canvas/core/string_utils.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <fstream>

namespace canvas::text {

namespace {

// First entry of a CSS family list, unquoted and lowercased.
std::string normalizeFamily(std::string_view family) {
    const std::size_t comma = family.find(',');
    if (comma != std::string_view::npos) {
        family = family.substr(0, comma);
    }
    family = trimAscii(family);
    if (family.size() >= 2 && (family.front() == '"' || family.front() == '\'') && family.back() == family.front()) {
        family = trimAscii(family.substr(1, family.size() - 2));
    }
    std::string out;
    out.reserve(family.size());
    for (const char c : family) {
        out.push_back(asciiLower(c));
    }
    return out;
}

} // namespace

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        CANVAS_LOG_WARN("[text] FT_Init_FreeType failed (%d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& entry : fonts_) {
        if (entry.second) destroyHandle(*entry.second);
    }
    fonts_.clear();
    familyMap_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

void FontManager::destroyHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from this buffer for the lifetime of the face.
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,
        &face
    );
    if (error || !face) {
        CANVAS_LOG_WARN("[text] FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    const std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family, bold, italic);
    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    fonts_[fontId] = std::move(handle);
    familyMap_[normalizeFamily(family)].push_back(fontId);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }

    CANVAS_LOG_DEBUG("[text] loaded font %u family '%s'%s%s", fontId, family.c_str(),
        bold ? " bold" : "", italic ? " italic" : "");
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(
    const std::string& filePath,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), familyName, bold, italic);
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    if (it->second) {
        auto familyIt = familyMap_.find(normalizeFamily(it->second->familyName));
        if (familyIt != familyMap_.end()) {
            auto& ids = familyIt->second;
            ids.erase(std::remove(ids.begin(), ids.end(), fontId), ids.end());
            if (ids.empty()) familyMap_.erase(familyIt);
        }
        destroyHandle(*it->second);
    }
    fonts_.erase(it);

    if (defaultFontId_ == fontId) {
        defaultFontId_ = 0;
        for (const auto& entry : fonts_) {
            if (defaultFontId_ == 0 || entry.first < defaultFontId_) defaultFontId_ = entry.first;
        }
    }
    return true;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

FontHandle* FontManager::getFontMutable(std::uint32_t fontId) {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return getFont(fontId) != nullptr;
}

std::uint32_t FontManager::resolveFont(std::string_view familyName, bool bold, bool italic) const {
    auto it = familyMap_.find(normalizeFamily(familyName));
    if (it == familyMap_.end() || it->second.empty()) {
        return defaultFontId_;
    }

    std::uint32_t regular = 0;
    for (const std::uint32_t id : it->second) {
        const FontHandle* handle = getFont(id);
        if (!handle) continue;
        if (handle->bold == bold && handle->italic == italic) return id;
        if (regular == 0 && !handle->bold && !handle->italic) regular = id;
    }
    return regular != 0 ? regular : it->second.front();
}

std::vector<std::string> FontManager::getFamilies() const {
    std::vector<std::string> families;
    families.reserve(familyMap_.size());
    for (const auto& entry : familyMap_) {
        families.push_back(entry.first);
    }
    std::sort(families.begin(), families.end());
    return families;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    const FontHandle* handle = getFont(fontId);
    if (!handle || handle->metrics.unitsPerEM <= 0.0f) {
        FontMetrics defaults{};
        defaults.ascender = fontSize * 0.8f;
        defaults.descender = fontSize * -0.2f;
        defaults.lineGap = fontSize * 0.1f;
        return defaults;
    }

    const float scale = fontSize / handle->metrics.unitsPerEM;
    FontMetrics scaled{};
    scaled.unitsPerEM = handle->metrics.unitsPerEM;
    scaled.ascender = handle->metrics.ascender * scale;
    scaled.descender = handle->metrics.descender * scale;
    scaled.lineGap = handle->metrics.lineGap * scale;
    return scaled;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    FontHandle* handle = getFontMutable(fontId);
    if (!handle || !handle->ftFace || !(fontSize > 0.0f)) {
        return false;
    }

    // 26.6 fixed point at 72 DPI, so one point is one canvas unit.
    FT_Error error = FT_Set_Char_Size(
        handle->ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSize * 64),
        72,
        72
    );
    if (error) {
        return false;
    }

    if (handle->hbFont) {
        hb_font_set_scale(
            handle->hbFont,
            static_cast<int>(fontSize * 64),
            static_cast<int>(fontSize * 64)
        );
    }
    return true;
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName,
    bool bold,
    bool italic
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->familyName = familyName;
    handle->bold = bold;
    handle->italic = italic;
    handle->ftFace = face;
    handle->fontData = std::move(fontData);

    handle->hbFont = hb_ft_font_create(face, nullptr);
    if (!handle->hbFont) {
        return nullptr;
    }

    handle->metrics = extractMetrics(face);
    return handle;
}

FontMetrics FontManager::extractMetrics(FT_Face face) const {
    FontMetrics metrics{};
    if (!face) {
        return metrics;
    }

    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    // OS/2 typo metrics are more consistent across platforms when present.
    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }
    return metrics;
}

} // namespace canvas::text
