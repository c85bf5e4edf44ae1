#include "window.hpp"

#include <termdeck/logger.hpp>
#include <termdeck/surface.hpp>

#include "input/keybindings.hpp"
#include "tab.hpp"

namespace termdeck
{

namespace
{

constexpr int NOTIFICATION_TIMEOUT_SECONDS = 3;

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}   // namespace

// ─── Capabilities ────────────────────────────────────────────────────────────

WindowCapabilities WindowCapabilities::resolve(const WindowConfig& config, const Toolkit& toolkit)
{
    WindowCapabilities caps;
    caps.enhanced_chrome =
        config.enhanced_chrome && config.titlebar && toolkit.supports_enhanced_chrome();
    caps.tab_overview  = caps.enhanced_chrome;
    caps.notifications = caps.enhanced_chrome;

    // The enhanced tab bar only supports top and bottom placement.
    caps.tabs_location = config.tabs_location;
    if (caps.enhanced_chrome
        && (caps.tabs_location == TabsLocation::Left || caps.tabs_location == TabsLocation::Right))
        caps.tabs_location = TabsLocation::Top;
    return caps;
}

// ─── Construction ────────────────────────────────────────────────────────────

Window::Window(WindowId            id,
               const WindowConfig& config,
               TerminalEngine&     engine,
               const Keybindings*  keybindings)
    : id_(id),
      config_(config),
      engine_(&engine),
      keybindings_(keybindings),
      title_(config.title),
      fullscreen_(config.fullscreen),
      decorated_(config.decoration),
      has_titlebar_(config.titlebar),
      titlebar_visible_(config.titlebar && config.decoration)
{
}

Window::~Window()
{
    destroy();
}

std::unique_ptr<Window> Window::create(WindowId            id,
                                       const WindowConfig& config,
                                       Toolkit&            toolkit,
                                       TerminalEngine&     engine,
                                       const Keybindings*  keybindings)
{
    std::unique_ptr<Window> window(new Window(id, config, engine, keybindings));
    if (!window->init(toolkit))
    {
        TERMDECK_LOG_ERROR("window", "Failed to create native window {}", id);
        return nullptr;
    }

    TERMDECK_LOG_INFO("window",
                      "Created window {} (enhanced chrome: {}, tabs: {})",
                      id,
                      window->caps_.enhanced_chrome,
                      tabs_location_name(window->caps_.tabs_location));
    return window;
}

bool Window::init(Toolkit& toolkit)
{
    caps_ = WindowCapabilities::resolve(config_, toolkit);

    WindowChrome chrome{
        .title         = title_,
        .width         = config_.width,
        .height        = config_.height,
        .titlebar      = has_titlebar_,
        .decorated     = decorated_,
        .fullscreen    = fullscreen_,
        .tabs_location = caps_.tabs_location,
        .wide_tabs     = config_.wide_tabs,
        .toolbar_style = config_.toolbar_style,
        .enhanced      = caps_.enhanced_chrome,
        .tab_overview  = caps_.tab_overview,
    };

    native_ = toolkit.create_window(chrome);
    if (!native_)
    {
        // Nothing to tear down.
        destroyed_ = true;
        return false;
    }

    native_->set_event_handler([this](const WindowEvent& event) { handle_event(event); });
    if (has_titlebar_)
        native_->set_region_visible(ChromeRegion::TitleBar, titlebar_visible_);

    // Tab bar pages mirror the notebook.
    notebook_.set_on_tab_added([this](Tab& tab) { native_->add_tab_page(tab.id()); });
    notebook_.set_on_tab_removed([this](TabId tab_id) { native_->remove_tab_page(tab_id); });
    notebook_.set_on_current_changed(
        [this](Tab* tab)
        {
            if (tab)
                native_->select_tab_page(tab->id());
        });

    if (caps_.notifications)
        dispatcher_.set_notify_callback([this](const std::string& text)
                                        { send_notification(text); });

    native_->present();
    return true;
}

// ─── Chrome ──────────────────────────────────────────────────────────────────

void Window::set_title(const std::string& title)
{
    title_ = title;
    if (!destroyed_)
        native_->set_title(title_);
}

void Window::toggle_fullscreen()
{
    if (destroyed_)
        return;
    fullscreen_ = !fullscreen_;
    native_->set_fullscreen(fullscreen_);
    TERMDECK_LOG_DEBUG("window", "Window {} fullscreen: {}", id_, fullscreen_);
}

void Window::toggle_window_decorations()
{
    if (destroyed_)
        return;
    decorated_ = !decorated_;
    native_->set_decorated(decorated_);

    // A configured title bar follows the decorations; an absent one stays absent.
    if (has_titlebar_)
    {
        titlebar_visible_ = decorated_;
        native_->set_region_visible(ChromeRegion::TitleBar, titlebar_visible_);
    }
    TERMDECK_LOG_DEBUG("window", "Window {} decorated: {}", id_, decorated_);
}

void Window::send_notification(const std::string& text)
{
    if (destroyed_ || !caps_.notifications)
        return;
    native_->show_notification(text, NOTIFICATION_TIMEOUT_SECONDS);
}

void Window::on_config_reloaded()
{
    send_notification("Reloaded the configuration");
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

Tab* Window::new_tab(const Surface* parent)
{
    if (destroyed_)
        return nullptr;

    auto tree = engine_->create_surface_tree(parent);
    if (!tree)
    {
        TERMDECK_LOG_ERROR("window", "Window {}: failed to create a terminal surface", id_);
        return nullptr;
    }

    Tab& tab = notebook_.append(std::make_unique<Tab>(next_tab_id_++, *this, std::move(tree)));
    TERMDECK_LOG_DEBUG("window", "Window {}: new tab {}", id_, tab.id());
    focus_current_tab();
    return &tab;
}

void Window::close_tab(Tab* tab)
{
    if (destroyed_)
        return;

    auto owned = notebook_.remove(tab);
    if (!owned)
        return;

    TERMDECK_LOG_DEBUG("window", "Window {}: closed tab {}", id_, owned->id());

    if (notebook_.empty())
    {
        destroy();
        return;
    }
    focus_current_tab();
}

void Window::handle_tab_emptied(Tab& tab)
{
    if (tab.tree().empty())
        close_tab(&tab);
}

void Window::goto_next_tab(const Surface* surface)
{
    Tab* tab = notebook_.tab_for_surface(surface);
    if (!tab)
    {
        TERMDECK_LOG_INFO("window", "Window {}: surface is not in any tab", id_);
        return;
    }
    notebook_.goto_next_from(*tab);
    focus_current_tab();
}

void Window::goto_previous_tab(const Surface* surface)
{
    Tab* tab = notebook_.tab_for_surface(surface);
    if (!tab)
    {
        TERMDECK_LOG_INFO("window", "Window {}: surface is not in any tab", id_);
        return;
    }
    notebook_.goto_previous_from(*tab);
    focus_current_tab();
}

void Window::goto_tab(size_t n)
{
    if (notebook_.goto_nth(n))
        focus_current_tab();
}

void Window::goto_last_tab()
{
    if (notebook_.goto_last())
        focus_current_tab();
}

void Window::focus_current_tab()
{
    if (Surface* surface = action_surface())
        surface->grab_focus();
}

// ─── Actions ─────────────────────────────────────────────────────────────────

Surface* Window::action_surface() const
{
    Tab* tab = notebook_.current_tab();
    return tab ? tab->focused_surface() : nullptr;
}

ActionResult Window::dispatch_action(Action action)
{
    if (destroyed_)
        return ActionResult::NoSurface;
    return dispatcher_.dispatch(action_surface(), action);
}

void Window::execute_command(const WindowCommand& command)
{
    using Kind = WindowCommand::Kind;
    switch (command.kind)
    {
        case Kind::Dispatch:
            dispatch_action(command.action);
            break;
        case Kind::NextTab:
            goto_next_tab(action_surface());
            break;
        case Kind::PreviousTab:
            goto_previous_tab(action_surface());
            break;
        case Kind::LastTab:
            goto_last_tab();
            break;
        case Kind::GotoTab:
            goto_tab(command.tab_index);
            break;
        case Kind::ToggleFullscreen:
            toggle_fullscreen();
            break;
        case Kind::ToggleDecorations:
            toggle_window_decorations();
            break;
        case Kind::CloseWindow:
            request_close();
            break;
    }
}

// ─── Events ──────────────────────────────────────────────────────────────────

void Window::handle_event(const WindowEvent& event)
{
    if (destroyed_)
    {
        TERMDECK_LOG_DEBUG("window",
                           "Window {}: dropping {} after destroy",
                           id_,
                           event_name(event));
        return;
    }

    std::visit(
        Overloaded{
            [this](const events::CloseRequested&) { request_close(); },
            [this](const events::Destroyed&) { destroy(); },
            [this](const events::ActionInvoked& e) { dispatch_action(e.action); },
            [this](const events::NewTabClicked&) { dispatch_action(Action::NewTab); },
            [this](const events::TabCreatedFromOverview&)
            {
                if (!caps_.tab_overview)
                {
                    TERMDECK_LOG_DEBUG("window", "Window {}: no tab overview, ignoring", id_);
                    return;
                }
                new_tab(action_surface());
            },
            [this](const events::ContextMenuClosed&) { focus_current_tab(); },
            [this](const events::AboutRequested&) { native_->show_about(); },
            [this](const events::KeyPressed& e)
            {
                if (!keybindings_)
                    return;
                if (auto command = keybindings_->lookup(e.key, e.mods))
                    execute_command(*command);
            },
        },
        event);
}

// ─── Close / destroy ─────────────────────────────────────────────────────────

void Window::request_close()
{
    if (destroyed_)
        return;
    close_confirm_.begin(*native_, surfaces(), [this]() { destroy(); });
}

std::vector<Surface*> Window::surfaces() const
{
    std::vector<Surface*> result;
    for (Tab* tab : notebook_.tabs())
    {
        auto tab_surfaces = tab->surfaces();
        result.insert(result.end(), tab_surfaces.begin(), tab_surfaces.end());
    }
    return result;
}

bool Window::needs_confirm_quit() const
{
    for (Tab* tab : notebook_.tabs())
    {
        if (tab->needs_confirm_quit())
            return true;
    }
    return false;
}

void Window::destroy()
{
    if (destroyed_)
        return;
    destroyed_ = true;

    close_confirm_.cancel();

    // Tear down without mirroring each page removal into a closing window.
    notebook_.set_on_tab_added(nullptr);
    notebook_.set_on_tab_removed(nullptr);
    notebook_.set_on_current_changed(nullptr);
    dispatcher_.set_notify_callback(nullptr);
    notebook_.take_all().clear();

    // The native object stays allocated until this Window is freed; we may be
    // running inside one of its callbacks.
    native_->set_event_handler(nullptr);
    native_->close();

    TERMDECK_LOG_INFO("window", "Window {} destroyed", id_);

    if (on_destroyed_)
    {
        auto cb = std::move(on_destroyed_);
        on_destroyed_ = nullptr;
        cb(*this);
    }
}

}   // namespace termdeck
