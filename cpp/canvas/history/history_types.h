#pragma once

#include <functional>
#include <string>

namespace canvas {

// A reversible edit. execute() and undo() must each leave the document fully
// consistent; closures capture the before/after snapshots they need.
struct Command {
    std::string description;
    std::function<void()> execute;
    std::function<void()> undo;
};

} // namespace canvas
