#include "canvas/editor/canvas_editor.h"

#include "canvas/core/logging.h"
#include "canvas/scene/scene_tree.h"

#include <algorithm>
#include <random>
#include <utility>

namespace canvas {

namespace {

constexpr std::size_t kIdLength = 13;
constexpr int kMaxIdAttempts = 16;

std::string randomBase36Id() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);

    std::string id;
    id.reserve(kIdLength);
    for (std::size_t i = 0; i < kIdLength; ++i) {
        id.push_back(kAlphabet[pick(rng)]);
    }
    return id;
}

} // namespace

void CanvasEditor::setIdGenerator(IdGenerator generator) {
    idGenerator_ = std::move(generator);
}

std::string CanvasEditor::generateId(std::unordered_set<std::string>& reserved) const {
    const auto isFree = [this, &reserved](const std::string& candidate) {
        return !candidate.empty() && reserved.count(candidate) == 0 && !containsObject(state_.objects, candidate)
            && !containsObject(state_.clipboard, candidate);
    };

    std::string id;
    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        id = idGenerator_ ? idGenerator_() : randomBase36Id();
        if (isFree(id)) {
            reserved.insert(id);
            return id;
        }
    }
    // Injected generators may repeat; disambiguate with a suffix.
    const std::string base = id.empty() ? randomBase36Id() : id;
    for (std::uint32_t n = 1;; ++n) {
        std::string candidate = base + "-" + std::to_string(n);
        if (isFree(candidate)) {
            reserved.insert(candidate);
            return candidate;
        }
    }
}

std::string CanvasEditor::generateId() const {
    std::unordered_set<std::string> reserved;
    return generateId(reserved);
}

void CanvasEditor::assignFreshIds(SceneObject& obj, std::unordered_set<std::string>& reserved) const {
    obj.id = generateId(reserved);
    for (SceneObject& child : obj.children) {
        assignFreshIds(child, reserved);
    }
}

std::size_t CanvasEditor::copyObjects() {
    // Top-level only, in document order; a selected child travels with its container.
    std::vector<SceneObject> copied;
    for (const SceneObject& obj : state_.objects) {
        if (std::find(state_.selectedIds.begin(), state_.selectedIds.end(), obj.id) != state_.selectedIds.end()) {
            copied.push_back(obj);
        }
    }
    if (copied.empty()) {
        CANVAS_LOG_DEBUG("[editor] copyObjects: nothing selected");
        return 0;
    }
    state_.clipboard = std::move(copied);
    CANVAS_LOG_DEBUG("[editor] copied %zu object(s)", state_.clipboard.size());
    return state_.clipboard.size();
}

std::vector<std::string> CanvasEditor::pasteObjects() {
    if (state_.clipboard.empty()) {
        CANVAS_LOG_DEBUG("[editor] pasteObjects: clipboard is empty");
        return {};
    }

    ContentSnapshot after = captureContent();
    std::vector<std::string> pastedIds;
    pastedIds.reserve(state_.clipboard.size());
    std::unordered_set<std::string> reserved;
    for (const SceneObject& source : state_.clipboard) {
        SceneObject copy = source;
        assignFreshIds(copy, reserved);
        copy.x += config_.pasteOffset;
        copy.y += config_.pasteOffset;
        pastedIds.push_back(copy.id);
        after.objects.push_back(std::move(copy));
    }

    std::string description = "Paste " + std::to_string(pastedIds.size()) + " object(s)";
    if (!commitContent(std::move(description), std::move(after), pastedIds, state_.selectedIds)) {
        return {};
    }
    CANVAS_LOG_DEBUG("[editor] pasted %zu object(s)", pastedIds.size());
    return pastedIds;
}

} // namespace canvas
