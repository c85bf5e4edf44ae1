#pragma once

#include <memory>
#include <string>
#include <termdeck/action.hpp>
#include <utility>
#include <vector>

namespace termdeck
{

// Result of asking the terminal engine to perform a binding action.
struct BindingResult
{
    bool        ok = true;
    std::string error;

    static BindingResult success() { return {}; }
    static BindingResult failure(std::string message) { return {false, std::move(message)}; }
};

// A single terminal session, owned by the terminal engine. The window
// controller only ever holds non-owning pointers to surfaces.
class Surface
{
   public:
    virtual ~Surface() = default;

    // True when closing would lose something, e.g. a running foreground process.
    virtual bool needs_confirm_quit() const = 0;

    virtual BindingResult perform_binding_action(Action action) = 0;

    // Move keyboard focus to this surface's widget.
    virtual void grab_focus() = 0;

    // Used to seed new tabs; empty when unknown.
    virtual std::string working_directory() const { return {}; }
};

// Split arrangement of surfaces inside one tab. Owns its surfaces.
class SurfaceTree
{
   public:
    virtual ~SurfaceTree() = default;

    // The surface that last held focus inside this tree, or nullptr.
    virtual Surface* focused_surface() const = 0;

    // Every surface in the tree, in layout order.
    virtual std::vector<Surface*> surfaces() const = 0;

    virtual bool empty() const = 0;
};

// Factory for surface trees.
class TerminalEngine
{
   public:
    virtual ~TerminalEngine() = default;

    // Creates a tree holding one new surface. When parent is non-null the new
    // surface inherits its working directory and environment. Returns nullptr
    // on failure.
    virtual std::unique_ptr<SurfaceTree> create_surface_tree(const Surface* parent) = 0;
};

}   // namespace termdeck
