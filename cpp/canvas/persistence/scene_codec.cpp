#include "canvas/persistence/scene_codec.h"

#include "canvas/core/util.h"
#include "canvas/persistence/codec_internal.h"

#include <cstring>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace

namespace canvas {
using namespace codec::detail;

namespace {

// =============================================================================
// Encoding
// =============================================================================

void appendString(std::vector<std::uint8_t>& out, const std::string& s) {
    appendU32(out, static_cast<std::uint32_t>(s.size()));
    const std::size_t o = out.size();
    out.resize(o + s.size());
    if (!s.empty()) {
        std::memcpy(out.data() + o, s.data(), s.size());
    }
}

void appendShape(std::vector<std::uint8_t>& out, const ShapeData& shape) {
    std::visit([&out](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RectShape>) {
            appendF32(out, s.width);
            appendF32(out, s.height);
            appendF32(out, s.cornerRadius);
            appendString(out, s.fill);
            appendString(out, s.stroke);
            appendF32(out, s.strokeWidth);
        } else if constexpr (std::is_same_v<T, CircleShape>) {
            appendF32(out, s.radius);
            appendString(out, s.fill);
            appendString(out, s.stroke);
            appendF32(out, s.strokeWidth);
        } else if constexpr (std::is_same_v<T, TextShape>) {
            appendString(out, s.text);
            appendF32(out, s.fontSize);
            appendString(out, s.fontFamily);
            std::uint32_t flags = 0;
            if (s.width) flags |= kTextHasWidth;
            if (s.isHyperlink) flags |= kTextHyperlink;
            appendU32(out, flags);
            appendF32(out, s.width.value_or(0.0f));
            appendString(out, s.fill);
            appendString(out, s.fontStyle);
            appendString(out, s.textDecoration);
            appendString(out, s.align);
        } else if constexpr (std::is_same_v<T, ImageShape>) {
            appendString(out, s.src);
            appendF32(out, s.width);
            appendF32(out, s.height);
            appendU32(out, s.crop ? 1u : 0u);
            const CropRect crop = s.crop.value_or(CropRect{0.0f, 0.0f, 0.0f, 0.0f});
            appendF32(out, crop.x);
            appendF32(out, crop.y);
            appendF32(out, crop.width);
            appendF32(out, crop.height);
        } else if constexpr (std::is_same_v<T, PathShape>) {
            appendU32(out, static_cast<std::uint32_t>(s.points.size()));
            for (const float p : s.points) appendF32(out, p);
            appendU32(out, s.closed ? 1u : 0u);
            appendString(out, s.fill);
            appendString(out, s.stroke);
            appendF32(out, s.strokeWidth);
            appendString(out, s.lineCap);
            appendString(out, s.lineJoin);
        } else if constexpr (std::is_same_v<T, ContainerShape>) {
            appendF32(out, s.width);
            appendF32(out, s.height);
            appendString(out, s.background);
            appendString(out, s.borderColor);
            appendF32(out, s.borderWidth);
            appendString(out, s.fill);
            appendString(out, s.stroke);
            appendF32(out, s.strokeWidth);
            appendU32(out, s.dashEnabled ? 1u : 0u);
            appendString(out, s.placeholder);
        }
    }, shape);
}

void appendObject(std::vector<std::uint8_t>& out, const SceneObject& obj) {
    appendString(out, obj.id);
    appendU32(out, static_cast<std::uint32_t>(obj.kind));
    appendF32(out, obj.x);
    appendF32(out, obj.y);
    appendF32(out, obj.rotation);
    appendF32(out, obj.scaleX);
    appendF32(out, obj.scaleY);
    appendF32(out, obj.opacity);
    appendU32(out, static_cast<std::uint32_t>(obj.zIndex));
    appendU32(out, obj.visible ? kObjectVisible : 0u);
    appendString(out, obj.name);
    appendShape(out, obj.shape);
    appendU32(out, static_cast<std::uint32_t>(obj.children.size()));
    for (const SceneObject& child : obj.children) {
        appendObject(out, child);
    }
}

// =============================================================================
// Decoding
// =============================================================================

struct Reader {
    const std::uint8_t* data;
    std::size_t size;
    std::size_t o{0};

    bool u32(std::uint32_t& v) {
        if (!requireBytes(o, 4, size)) return false;
        v = readU32(data, o);
        o += 4;
        return true;
    }

    bool f32(float& v) {
        if (!requireBytes(o, 4, size)) return false;
        v = readF32(data, o);
        o += 4;
        return true;
    }

    bool flag(bool& v) {
        std::uint32_t raw = 0;
        if (!u32(raw)) return false;
        v = raw != 0;
        return true;
    }

    bool str(std::string& s) {
        std::uint32_t len = 0;
        if (!u32(len)) return false;
        if (!requireBytes(o, len, size)) return false;
        s.assign(reinterpret_cast<const char*>(data + o), len);
        o += len;
        return true;
    }
};

CodecError readShape(Reader& r, ObjectKind kind, ShapeData& out) {
    switch (shapeIndexForKind(kind)) {
        case 0: {
            RectShape s{};
            if (!(r.f32(s.width) && r.f32(s.height) && r.f32(s.cornerRadius))) return CodecError::BufferTruncated;
            if (!(r.str(s.fill) && r.str(s.stroke) && r.f32(s.strokeWidth))) return CodecError::BufferTruncated;
            out = std::move(s);
            return CodecError::Ok;
        }
        case 1: {
            CircleShape s{};
            if (!(r.f32(s.radius) && r.str(s.fill) && r.str(s.stroke) && r.f32(s.strokeWidth))) return CodecError::BufferTruncated;
            out = std::move(s);
            return CodecError::Ok;
        }
        case 2: {
            TextShape s{};
            std::uint32_t flags = 0;
            float width = 0.0f;
            if (!(r.str(s.text) && r.f32(s.fontSize) && r.str(s.fontFamily))) return CodecError::BufferTruncated;
            if (!(r.u32(flags) && r.f32(width))) return CodecError::BufferTruncated;
            if (!(r.str(s.fill) && r.str(s.fontStyle) && r.str(s.textDecoration) && r.str(s.align))) return CodecError::BufferTruncated;
            if (flags & kTextHasWidth) s.width = width;
            s.isHyperlink = (flags & kTextHyperlink) != 0;
            out = std::move(s);
            return CodecError::Ok;
        }
        case 3: {
            ImageShape s{};
            bool hasCrop = false;
            CropRect crop{0.0f, 0.0f, 0.0f, 0.0f};
            if (!(r.str(s.src) && r.f32(s.width) && r.f32(s.height) && r.flag(hasCrop))) return CodecError::BufferTruncated;
            if (!(r.f32(crop.x) && r.f32(crop.y) && r.f32(crop.width) && r.f32(crop.height))) return CodecError::BufferTruncated;
            if (hasCrop) s.crop = crop;
            out = std::move(s);
            return CodecError::Ok;
        }
        case 4: {
            PathShape s{};
            std::uint32_t count = 0;
            if (!(r.u32(count))) return CodecError::BufferTruncated;
            std::size_t bytes = 0;
            if (!tryMul(count, 4, bytes)) return CodecError::InvalidPayloadSize;
            if (!requireBytes(r.o, bytes, r.size)) return CodecError::BufferTruncated;
            s.points.resize(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                if (!(r.f32(s.points[i]))) return CodecError::BufferTruncated;
            }
            if (!(r.flag(s.closed) && r.str(s.fill) && r.str(s.stroke) && r.f32(s.strokeWidth))) return CodecError::BufferTruncated;
            if (!(r.str(s.lineCap) && r.str(s.lineJoin))) return CodecError::BufferTruncated;
            out = std::move(s);
            return CodecError::Ok;
        }
        case 5: {
            ContainerShape s{};
            if (!(r.f32(s.width) && r.f32(s.height) && r.str(s.background) && r.str(s.borderColor))) return CodecError::BufferTruncated;
            if (!(r.f32(s.borderWidth) && r.str(s.fill) && r.str(s.stroke) && r.f32(s.strokeWidth))) return CodecError::BufferTruncated;
            if (!(r.flag(s.dashEnabled) && r.str(s.placeholder))) return CodecError::BufferTruncated;
            out = std::move(s);
            return CodecError::Ok;
        }
        default:
            return CodecError::UnknownObjectKind;
    }
}

CodecError readObject(Reader& r, std::uint32_t depth, SceneObject& out) {
    if (depth > kMaxSceneNestingDepth) return CodecError::NestingTooDeep;

    std::uint32_t kind = 0;
    std::uint32_t zIndex = 0;
    std::uint32_t flags = 0;
    if (!(r.str(out.id) && r.u32(kind))) return CodecError::BufferTruncated;
    if (kind >= kObjectKindCount) return CodecError::UnknownObjectKind;
    out.kind = static_cast<ObjectKind>(kind);

    if (!(r.f32(out.x) && r.f32(out.y) && r.f32(out.rotation))) return CodecError::BufferTruncated;
    if (!(r.f32(out.scaleX) && r.f32(out.scaleY) && r.f32(out.opacity))) return CodecError::BufferTruncated;
    if (!(r.u32(zIndex) && r.u32(flags) && r.str(out.name))) return CodecError::BufferTruncated;
    out.zIndex = static_cast<std::int32_t>(zIndex);
    out.visible = (flags & kObjectVisible) != 0;

    const CodecError shapeErr = readShape(r, out.kind, out.shape);
    if (shapeErr != CodecError::Ok) return shapeErr;

    std::uint32_t childCount = 0;
    if (!(r.u32(childCount))) return CodecError::BufferTruncated;
    out.children.clear();
    for (std::uint32_t i = 0; i < childCount; ++i) {
        SceneObject child{};
        const CodecError err = readObject(r, depth + 1, child);
        if (err != CodecError::Ok) return err;
        out.children.push_back(std::move(child));
    }
    return CodecError::Ok;
}

} // namespace

std::vector<std::uint8_t> encodeSceneDocument(const SceneDocument& doc) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(2);

    // DOCM
    {
        SectionBytes sec{TAG_DOCM, {}};
        std::uint32_t flags = 0;
        if (doc.width) flags |= kDocHasWidth;
        if (doc.height) flags |= kDocHasHeight;
        if (doc.background) flags |= kDocHasBackground;
        appendU32(sec.bytes, flags);
        appendF32(sec.bytes, doc.width.value_or(0.0f));
        appendF32(sec.bytes, doc.height.value_or(0.0f));
        appendString(sec.bytes, doc.background.value_or(std::string()));
        sections.push_back(std::move(sec));
    }

    // OBJS
    {
        SectionBytes sec{TAG_OBJS, {}};
        appendU32(sec.bytes, static_cast<std::uint32_t>(doc.objects.size()));
        for (const SceneObject& obj : doc.objects) {
            appendObject(sec.bytes, obj);
        }
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = kSceneHeaderBytes;
    const std::size_t tableBytes = sections.size() * kSceneSectionEntryBytes;
    std::size_t payloadBytes = 0;
    for (const auto& sec : sections) payloadBytes += sec.bytes.size();
    const std::size_t totalBytes = headerBytes + tableBytes + payloadBytes;

    std::vector<std::uint8_t> out;
    out.resize(totalBytes);

    writeU32LE(out.data(), 0, kSceneMagic);
    writeU32LE(out.data(), 4, kSceneVersion);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t tableOffset = headerBytes;
    std::size_t dataOffset = headerBytes + tableBytes;
    for (const auto& sec : sections) {
        writeU32LE(out.data(), tableOffset + 0, sec.tag);
        writeU32LE(out.data(), tableOffset + 4, static_cast<std::uint32_t>(dataOffset));
        writeU32LE(out.data(), tableOffset + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), tableOffset + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) {
            std::memcpy(out.data() + dataOffset, sec.bytes.data(), sec.bytes.size());
        }
        tableOffset += kSceneSectionEntryBytes;
        dataOffset += sec.bytes.size();
    }

    return out;
}

CodecError decodeSceneDocument(const std::uint8_t* src, std::size_t byteCount, SceneDocument& out) {
    if (!src || byteCount < kSceneHeaderBytes) {
        return CodecError::BufferTruncated;
    }

    if (readU32(src, 0) != kSceneMagic) return CodecError::InvalidMagic;
    if (readU32(src, 4) != kSceneVersion) return CodecError::UnsupportedVersion;

    const std::uint32_t sectionCount = readU32(src, 8);
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), kSceneSectionEntryBytes, tableBytes)) {
        return CodecError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(kSceneHeaderBytes, tableBytes, headerPlusTable)) {
        return CodecError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return CodecError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = kSceneHeaderBytes + i * kSceneSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return CodecError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return CodecError::InvalidPayloadSize;
        if (end > byteCount) return CodecError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) return CodecError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto docm = sections.find(TAG_DOCM);
    const auto objs = sections.find(TAG_OBJS);
    if (docm == sections.end() || objs == sections.end()) {
        return CodecError::InvalidPayloadSize;
    }

    SceneDocument doc{};

    // DOCM
    {
        Reader r{docm->second.data, docm->second.size};
        std::uint32_t flags = 0;
        float width = 0.0f;
        float height = 0.0f;
        std::string background;
        if (!r.u32(flags) || !r.f32(width) || !r.f32(height) || !r.str(background)) {
            return CodecError::BufferTruncated;
        }
        if (flags & kDocHasWidth) doc.width = width;
        if (flags & kDocHasHeight) doc.height = height;
        if (flags & kDocHasBackground) doc.background = std::move(background);
    }

    // OBJS
    {
        Reader r{objs->second.data, objs->second.size};
        std::uint32_t count = 0;
        if (!r.u32(count)) return CodecError::BufferTruncated;
        for (std::uint32_t i = 0; i < count; ++i) {
            SceneObject obj{};
            const CodecError err = readObject(r, 1, obj);
            if (err != CodecError::Ok) return err;
            doc.objects.push_back(std::move(obj));
        }
        if (r.o != r.size) return CodecError::InvalidPayloadSize;
    }

    out = std::move(doc);
    return CodecError::Ok;
}

const char* codecErrorName(CodecError err) noexcept {
    switch (err) {
        case CodecError::Ok: return "ok";
        case CodecError::InvalidMagic: return "invalid-magic";
        case CodecError::UnsupportedVersion: return "unsupported-version";
        case CodecError::BufferTruncated: return "buffer-truncated";
        case CodecError::InvalidPayloadSize: return "invalid-payload-size";
        case CodecError::UnknownObjectKind: return "unknown-object-kind";
        case CodecError::NestingTooDeep: return "nesting-too-deep";
    }
    return "unknown";
}

} // namespace canvas
