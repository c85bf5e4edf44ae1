#pragma once

#include <functional>
#include <memory>
#include <string>
#include <termdeck/config.hpp>
#include <termdeck/fwd.hpp>

#include "window_event.hpp"

namespace termdeck
{

enum class ChromeRegion
{
    TitleBar,
    TabBar,
};

enum class PromptResponse
{
    Yes,
    No,
    Dismissed,   // closed without choosing; treated as No
};

// Modal yes/no question. The adapter must make `default_response` the
// button activated by Enter, and style the Yes button as destructive when
// `yes_is_destructive` is set.
struct PromptRequest
{
    std::string    heading;
    std::string    body;
    std::string    yes_label          = "Yes";
    std::string    no_label           = "No";
    bool           yes_is_destructive = true;
    PromptResponse default_response   = PromptResponse::No;
};

using PromptCallback     = std::function<void(PromptResponse)>;
using WindowEventHandler = std::function<void(const WindowEvent&)>;

// Everything the adapter needs to build the native window, resolved once.
struct WindowChrome
{
    std::string  title;
    int          width         = 1000;
    int          height        = 600;
    bool         titlebar      = true;
    bool         decorated     = true;
    bool         fullscreen    = false;
    TabsLocation tabs_location = TabsLocation::Top;
    bool         wide_tabs     = true;
    ToolbarStyle toolbar_style = ToolbarStyle::Raised;
    bool         enhanced      = false;
    bool         tab_overview  = false;
};

// One native window as seen by the controller. Calls are commands; events
// come back through the handler installed with set_event_handler().
class ToolkitWindow
{
   public:
    virtual ~ToolkitWindow() = default;

    // The handler may replace itself while running; adapters invoke a copy.
    virtual void set_event_handler(WindowEventHandler handler) = 0;

    virtual void set_title(const std::string& title) = 0;
    virtual void set_fullscreen(bool fullscreen)     = 0;
    virtual void set_decorated(bool decorated)       = 0;
    virtual void set_region_visible(ChromeRegion region, bool visible) = 0;

    // Tab bar pages mirror the notebook.
    virtual void add_tab_page(TabId id)    = 0;
    virtual void remove_tab_page(TabId id) = 0;
    virtual void select_tab_page(TabId id) = 0;

    // Non-blocking. The callback runs later on the UI thread, at most once.
    virtual void show_prompt(const PromptRequest& request, PromptCallback callback) = 0;

    // Dismiss a pending prompt without invoking its callback.
    virtual void cancel_prompt() = 0;

    virtual void show_notification(const std::string& text, int timeout_seconds) = 0;
    virtual void show_about() = 0;

    virtual void present() = 0;

    // Tear down the native window. No events are delivered afterwards.
    virtual void close() = 0;
};

class Toolkit
{
   public:
    virtual ~Toolkit() = default;

    // Returns nullptr if the native window could not be created.
    virtual std::unique_ptr<ToolkitWindow> create_window(const WindowChrome& chrome) = 0;

    // Whether the enhanced chrome variant (tab overview, notifications,
    // toolbar view) is available in this build/runtime.
    virtual bool supports_enhanced_chrome() const = 0;
};

}   // namespace termdeck
