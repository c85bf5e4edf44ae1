#pragma once

#include <cstdint>
#include <memory>
#include <termdeck/config.hpp>
#include <termdeck/fwd.hpp>
#include <vector>

#include "input/keybindings.hpp"

namespace termdeck
{

// Owns every top-level Window of the process.
//
// Windows are inserted on creation and leave the active list the moment they
// are destroyed (by confirmation, by the toolkit or by destroy_window()).
// Their objects are kept alive until collect_destroyed(), so a window may be
// destroyed from inside one of its own event handlers.
//
// Usage:
//   WindowRegistry registry(toolkit, engine, config);
//   registry.open_window();
//   // In the event loop:
//   toolkit.poll();
//   registry.collect_destroyed();
//   if (!registry.any_window_open()) break;
//   ...
//   registry.shutdown();
class WindowRegistry
{
   public:
    WindowRegistry(Toolkit& toolkit, TerminalEngine& engine, WindowConfig config = {});
    ~WindowRegistry();

    WindowRegistry(const WindowRegistry&)            = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;

    // Create a window with an empty notebook. Returns nullptr on failure;
    // nothing is registered in that case.
    Window* create_window();

    // Create a window holding one tab seeded from parent. If the tab cannot be
    // created the window is discarded and nullptr returned.
    Window* open_window(const Surface* parent = nullptr);

    Window* find(WindowId id) const;
    Window* window_for_surface(const Surface* surface) const;

    // Open (not destroyed) windows, in creation order.
    const std::vector<Window*>& windows() const { return active_ptrs_; }
    size_t                      window_count() const { return active_ptrs_.size(); }
    bool                        any_window_open() const { return !active_ptrs_.empty(); }

    // Immediate teardown of one window, skipping confirmation and
    // invalidating any pending close prompt.
    void destroy_window(WindowId id);

    // Free destroyed windows. Call from the event loop, outside any window
    // callback. Returns the number freed.
    size_t collect_destroyed();

    // Destroy and free every window.
    void shutdown();

    // Every surface in every open window.
    std::vector<Surface*> all_surfaces() const;

    // True if quitting the process now would need user confirmation.
    bool needs_confirm_quit() const;

    const WindowConfig& config() const { return config_; }

    // Replace the config used for future windows, re-apply keybindings and
    // log level, and tell every open window.
    void reload_config(const WindowConfig& config);

    Keybindings&       keybindings() { return keybindings_; }
    const Keybindings& keybindings() const { return keybindings_; }

   private:
    void apply_config();
    void on_window_destroyed(Window& window);
    void rebuild_active_list();

    Toolkit*        toolkit_;
    TerminalEngine* engine_;
    WindowConfig    config_;
    Keybindings     keybindings_;

    std::vector<std::unique_ptr<Window>> windows_;
    std::vector<Window*>                 active_ptrs_;   // cache of open windows
    WindowId                             next_window_id_ = 1;

    // Destroyed windows awaiting collect_destroyed()
    std::vector<WindowId> pending_free_ids_;
};

}   // namespace termdeck
