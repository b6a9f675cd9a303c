#ifndef ARTCHIVE_CANVAS_PERSISTENCE_SCENE_CODEC_H
#define ARTCHIVE_CANVAS_PERSISTENCE_SCENE_CODEC_H

#include "canvas/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace canvas {

// "GSCN" little-endian
static constexpr std::uint32_t kSceneMagic = 0x4E435347;
static constexpr std::uint32_t kSceneVersion = 1;
static constexpr std::size_t kSceneHeaderBytes = 4 * 4;       // magic + version + sectionCount + reserved
static constexpr std::size_t kSceneSectionEntryBytes = 4 * 4; // tag + offset + size + crc32
static constexpr std::uint32_t kMaxSceneNestingDepth = 64;

// Sections: DOCM (canvas width/height/background) and OBJS (recursive object
// records). All scalars little-endian.
std::vector<std::uint8_t> encodeSceneDocument(const SceneDocument& doc);

// `out` is only written on success.
CodecError decodeSceneDocument(const std::uint8_t* src, std::size_t byteCount, SceneDocument& out);

const char* codecErrorName(CodecError err) noexcept;

} // namespace canvas

#endif // ARTCHIVE_CANVAS_PERSISTENCE_SCENE_CODEC_H
