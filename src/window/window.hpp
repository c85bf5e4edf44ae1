#pragma once

#include <functional>
#include <memory>
#include <string>
#include <termdeck/action.hpp>
#include <termdeck/config.hpp>
#include <termdeck/fwd.hpp>
#include <vector>

#include "action_dispatcher.hpp"
#include "close_confirmation.hpp"
#include "notebook.hpp"
#include "toolkit.hpp"
#include "window_command.hpp"
#include "window_event.hpp"

namespace termdeck
{

// Feature set resolved once at window construction and kept for the
// window's lifetime.
struct WindowCapabilities
{
    bool         enhanced_chrome = false;
    bool         tab_overview    = false;
    bool         notifications   = false;
    TabsLocation tabs_location   = TabsLocation::Top;

    static WindowCapabilities resolve(const WindowConfig& config, const Toolkit& toolkit);
};

/**
 * Window — Controller for one top-level terminal window.
 *
 * Owns exactly one Notebook (possibly empty), the window chrome state and the
 * close-confirmation workflow. Toolkit events arrive through handle_event();
 * binding actions are routed to the focused surface of the current tab.
 *
 * destroy() tears the window down synchronously (tabs, surfaces, native
 * window, pending prompt) but the Window object itself stays valid until its
 * owner frees it, so destroy() may be reached from inside any event handler.
 */
class Window
{
   public:
    using DestroyedCallback = std::function<void(Window& window)>;

    // Returns nullptr if the native window could not be created.
    static std::unique_ptr<Window> create(WindowId            id,
                                          const WindowConfig& config,
                                          Toolkit&            toolkit,
                                          TerminalEngine&     engine,
                                          const Keybindings*  keybindings = nullptr);

    ~Window();

    Window(const Window&)            = delete;
    Window& operator=(const Window&) = delete;

    WindowId                  id() const { return id_; }
    const WindowCapabilities& capabilities() const { return caps_; }

    // Chrome state
    const std::string& title() const { return title_; }
    void               set_title(const std::string& title);
    bool               fullscreen() const { return fullscreen_; }
    bool               decorated() const { return decorated_; }
    bool               has_titlebar() const { return has_titlebar_; }
    bool               titlebar_visible() const { return titlebar_visible_; }

    // Tabs
    Notebook&       notebook() { return notebook_; }
    const Notebook& notebook() const { return notebook_; }
    bool            has_tabs() const { return !notebook_.empty(); }

    // Create a tab seeded from parent (may be null), append it and select it.
    // Returns nullptr if the engine could not create the surface tree.
    Tab* new_tab(const Surface* parent = nullptr);

    // Remove a tab. Closing the last tab closes the window.
    void close_tab(Tab* tab);

    // The tab's surface tree may have lost its last surface.
    void handle_tab_emptied(Tab& tab);

    // Navigation; each focuses the current tab when it selects something.
    void goto_next_tab(const Surface* surface);
    void goto_previous_tab(const Surface* surface);
    void goto_tab(size_t n);   // 1-based; 0 is a no-op
    void goto_last_tab();

    void toggle_fullscreen();
    void toggle_window_decorations();
    void focus_current_tab();

    // The focused surface of the current tab, or nullptr.
    Surface*     action_surface() const;
    ActionResult dispatch_action(Action action);
    void         execute_command(const WindowCommand& command);

    void handle_event(const WindowEvent& event);

    // Runs the close-confirmation workflow.
    void request_close();

    // Every surface in every tab, in tab order.
    std::vector<Surface*> surfaces() const;
    bool                  needs_confirm_quit() const;

    const CloseConfirmation& close_confirmation() const { return close_confirm_; }
    CloseState               close_state() const { return close_confirm_.state(); }

    // Immediate teardown with no confirmation. Idempotent.
    void destroy();
    bool is_destroyed() const { return destroyed_; }

    void on_config_reloaded();

    void set_on_destroyed(DestroyedCallback cb) { on_destroyed_ = std::move(cb); }

   private:
    Window(WindowId            id,
           const WindowConfig& config,
           TerminalEngine&     engine,
           const Keybindings*  keybindings);

    bool init(Toolkit& toolkit);
    void send_notification(const std::string& text);

    WindowId           id_;
    WindowConfig       config_;
    WindowCapabilities caps_;
    TerminalEngine*    engine_;
    const Keybindings* keybindings_;

    std::string title_;
    bool        fullscreen_       = false;
    bool        decorated_        = true;
    bool        has_titlebar_     = false;
    bool        titlebar_visible_ = false;
    bool        destroyed_        = false;
    TabId       next_tab_id_      = 1;

    // Declared before the notebook and workflow so it outlives both.
    std::unique_ptr<ToolkitWindow> native_;

    Notebook          notebook_;
    ActionDispatcher  dispatcher_;
    CloseConfirmation close_confirm_;
    DestroyedCallback on_destroyed_;
};

}   // namespace termdeck
