#include "window_registry.hpp"

#include <algorithm>
#include <termdeck/logger.hpp>

#include "window.hpp"

namespace termdeck
{

WindowRegistry::WindowRegistry(Toolkit& toolkit, TerminalEngine& engine, WindowConfig config)
    : toolkit_(&toolkit), engine_(&engine), config_(std::move(config))
{
    apply_config();
}

WindowRegistry::~WindowRegistry()
{
    shutdown();
}

void WindowRegistry::apply_config()
{
    if (config_.log_level)
        Logger::instance().set_level(*config_.log_level);

    keybindings_.clear();
    keybindings_.register_defaults();
    size_t applied = keybindings_.apply_overrides(config_.keybinds);
    TERMDECK_LOG_DEBUG("registry",
                       "{} keybindings ({} overrides applied)",
                       keybindings_.count(),
                       applied);
}

// ─── Creation ────────────────────────────────────────────────────────────────

Window* WindowRegistry::create_window()
{
    const WindowId id = next_window_id_++;

    auto window = Window::create(id, config_, *toolkit_, *engine_, &keybindings_);
    if (!window)
    {
        TERMDECK_LOG_ERROR("registry", "create_window: window {} could not be created", id);
        return nullptr;
    }

    window->set_on_destroyed([this](Window& w) { on_window_destroyed(w); });

    Window* ptr = window.get();
    windows_.push_back(std::move(window));
    rebuild_active_list();

    TERMDECK_LOG_INFO("registry", "Registered window {} ({} open)", id, active_ptrs_.size());
    return ptr;
}

Window* WindowRegistry::open_window(const Surface* parent)
{
    Window* window = create_window();
    if (!window)
        return nullptr;

    if (!window->new_tab(parent))
    {
        TERMDECK_LOG_ERROR("registry", "open_window: no initial tab for window {}", window->id());
        const WindowId id = window->id();
        window->destroy();
        std::erase_if(windows_, [id](const auto& w) { return w->id() == id; });
        std::erase(pending_free_ids_, id);
        return nullptr;
    }
    return window;
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

Window* WindowRegistry::find(WindowId id) const
{
    for (Window* w : active_ptrs_)
    {
        if (w->id() == id)
            return w;
    }
    return nullptr;
}

Window* WindowRegistry::window_for_surface(const Surface* surface) const
{
    for (Window* w : active_ptrs_)
    {
        if (w->notebook().tab_for_surface(surface))
            return w;
    }
    return nullptr;
}

std::vector<Surface*> WindowRegistry::all_surfaces() const
{
    std::vector<Surface*> result;
    for (Window* w : active_ptrs_)
    {
        auto surfaces = w->surfaces();
        result.insert(result.end(), surfaces.begin(), surfaces.end());
    }
    return result;
}

bool WindowRegistry::needs_confirm_quit() const
{
    return std::any_of(active_ptrs_.begin(),
                       active_ptrs_.end(),
                       [](const Window* w) { return w->needs_confirm_quit(); });
}

// ─── Teardown ────────────────────────────────────────────────────────────────

void WindowRegistry::destroy_window(WindowId id)
{
    Window* window = find(id);
    if (!window)
    {
        TERMDECK_LOG_DEBUG("registry", "destroy_window: no open window {}", id);
        return;
    }
    window->destroy();
}

void WindowRegistry::on_window_destroyed(Window& window)
{
    pending_free_ids_.push_back(window.id());
    rebuild_active_list();
    TERMDECK_LOG_INFO("registry",
                      "Window {} closed ({} still open)",
                      window.id(),
                      active_ptrs_.size());
}

size_t WindowRegistry::collect_destroyed()
{
    if (pending_free_ids_.empty())
        return 0;

    // Copy and clear: freeing a window must not see a half-updated list
    auto ids = std::move(pending_free_ids_);
    pending_free_ids_.clear();

    size_t freed = 0;
    for (WindowId id : ids)
    {
        freed += std::erase_if(windows_, [id](const auto& w) { return w->id() == id; });
    }
    return freed;
}

void WindowRegistry::shutdown()
{
    // Snapshot: each destroy() shrinks active_ptrs_.
    auto open = active_ptrs_;
    for (Window* w : open)
        w->destroy();
    collect_destroyed();
    windows_.clear();
    active_ptrs_.clear();
}

void WindowRegistry::rebuild_active_list()
{
    active_ptrs_.clear();
    for (const auto& w : windows_)
    {
        if (!w->is_destroyed())
            active_ptrs_.push_back(w.get());
    }
}

// ─── Config ──────────────────────────────────────────────────────────────────

void WindowRegistry::reload_config(const WindowConfig& config)
{
    config_ = config;
    apply_config();
    TERMDECK_LOG_INFO("config", "Configuration reloaded");
    for (Window* w : active_ptrs_)
        w->on_config_reloaded();
}

}   // namespace termdeck
