#pragma once

#include <memory>
#include <string>
#include <termdeck/fwd.hpp>
#include <termdeck/surface.hpp>
#include <vector>

namespace termdeck
{

/**
 * Tab — One selectable page of a window, owning a single surface tree.
 *
 * The back-reference to the owning Window is non-owning; ownership flows
 * strictly downward (Window -> Notebook -> Tab -> SurfaceTree).
 */
class Tab
{
   public:
    Tab(TabId id, Window& window, std::unique_ptr<SurfaceTree> tree);
    ~Tab() = default;

    Tab(const Tab&)            = delete;
    Tab& operator=(const Tab&) = delete;

    TabId   id() const { return id_; }
    Window& window() const { return *window_; }

    SurfaceTree&       tree() { return *tree_; }
    const SurfaceTree& tree() const { return *tree_; }

    // The surface that keyboard focus returns to when this tab is selected.
    Surface* focused_surface() const;

    std::vector<Surface*> surfaces() const;
    bool                  contains(const Surface* surface) const;

    // True if any surface in this tab asks to confirm before closing.
    bool needs_confirm_quit() const;

   private:
    TabId                        id_;
    Window*                      window_;
    std::unique_ptr<SurfaceTree> tree_;
};

}   // namespace termdeck
