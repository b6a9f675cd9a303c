#ifndef ARTCHIVE_CANVAS_SCENE_SCENE_TREE_H
#define ARTCHIVE_CANVAS_SCENE_SCENE_TREE_H

#include "canvas/core/types.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace canvas {

// Index path from the top-level list down to an object: path[0] indexes the
// top-level objects, path[1] the children of that object, and so on.
using ObjectPath = std::vector<std::size_t>;

// Depth-first search through container children.
const SceneObject* findObject(const std::vector<SceneObject>& objects, std::string_view id);

bool findObjectPath(const std::vector<SceneObject>& objects, std::string_view id, ObjectPath& out);

SceneObject* objectAtPath(std::vector<SceneObject>& objects, const ObjectPath& path);

// List that owns the object at `path` (the top-level list or a container's
// children). Null for an empty or dangling path.
std::vector<SceneObject>* siblingsAtPath(std::vector<SceneObject>& objects, const ObjectPath& path);

inline bool containsObject(const std::vector<SceneObject>& objects, std::string_view id) {
    return findObject(objects, id) != nullptr;
}

// Appends every id in the subtree(s), parents before children.
void collectIds(const std::vector<SceneObject>& objects, std::vector<std::string>& out);
void collectIds(const SceneObject& obj, std::vector<std::string>& out);

// Recomputes stored group sizes along `path`, deepest container first.
void refreshAncestorGroups(std::vector<SceneObject>& objects, const ObjectPath& path);

} // namespace canvas

#endif // ARTCHIVE_CANVAS_SCENE_SCENE_TREE_H
