#include "canvas/scene/scene_tree.h"

#include "canvas/scene/scene_object.h"

namespace canvas {

namespace {

bool findPathRecursive(const std::vector<SceneObject>& objects, std::string_view id, ObjectPath& path) {
    for (std::size_t i = 0; i < objects.size(); ++i) {
        path.push_back(i);
        if (objects[i].id == id) return true;
        if (!objects[i].children.empty() && findPathRecursive(objects[i].children, id, path)) return true;
        path.pop_back();
    }
    return false;
}

} // namespace

const SceneObject* findObject(const std::vector<SceneObject>& objects, std::string_view id) {
    for (const SceneObject& obj : objects) {
        if (obj.id == id) return &obj;
        if (const SceneObject* nested = findObject(obj.children, id)) return nested;
    }
    return nullptr;
}

bool findObjectPath(const std::vector<SceneObject>& objects, std::string_view id, ObjectPath& out) {
    out.clear();
    if (findPathRecursive(objects, id, out)) return true;
    out.clear();
    return false;
}

SceneObject* objectAtPath(std::vector<SceneObject>& objects, const ObjectPath& path) {
    std::vector<SceneObject>* list = &objects;
    SceneObject* current = nullptr;
    for (const std::size_t index : path) {
        if (index >= list->size()) return nullptr;
        current = &(*list)[index];
        list = &current->children;
    }
    return current;
}

std::vector<SceneObject>* siblingsAtPath(std::vector<SceneObject>& objects, const ObjectPath& path) {
    if (path.empty()) return nullptr;
    if (path.size() == 1) return path[0] < objects.size() ? &objects : nullptr;

    const ObjectPath parentPath(path.begin(), path.end() - 1);
    SceneObject* parent = objectAtPath(objects, parentPath);
    if (!parent || path.back() >= parent->children.size()) return nullptr;
    return &parent->children;
}

void collectIds(const SceneObject& obj, std::vector<std::string>& out) {
    out.push_back(obj.id);
    collectIds(obj.children, out);
}

void collectIds(const std::vector<SceneObject>& objects, std::vector<std::string>& out) {
    for (const SceneObject& obj : objects) {
        collectIds(obj, out);
    }
}

void refreshAncestorGroups(std::vector<SceneObject>& objects, const ObjectPath& path) {
    for (std::size_t depth = path.size(); depth > 0; --depth) {
        const ObjectPath prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(depth));
        SceneObject* node = objectAtPath(objects, prefix);
        if (node) recalculateGroupBounds(*node);
    }
}

} // namespace canvas
