#include "tab.hpp"

#include <algorithm>

namespace termdeck
{

Tab::Tab(TabId id, Window& window, std::unique_ptr<SurfaceTree> tree)
    : id_(id), window_(&window), tree_(std::move(tree))
{
}

Surface* Tab::focused_surface() const
{
    return tree_ ? tree_->focused_surface() : nullptr;
}

std::vector<Surface*> Tab::surfaces() const
{
    if (!tree_)
        return {};
    return tree_->surfaces();
}

bool Tab::contains(const Surface* surface) const
{
    if (!surface)
        return false;
    auto all = surfaces();
    return std::find(all.begin(), all.end(), surface) != all.end();
}

bool Tab::needs_confirm_quit() const
{
    auto all = surfaces();
    return std::any_of(all.begin(),
                       all.end(),
                       [](const Surface* s) { return s && s->needs_confirm_quit(); });
}

}   // namespace termdeck
