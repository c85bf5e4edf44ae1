#include "notebook.hpp"

#include <termdeck/logger.hpp>

namespace termdeck
{

Tab& Notebook::append(std::unique_ptr<Tab> tab)
{
    Tab& ref = *tab;
    tabs_.push_back(std::move(tab));

    TERMDECK_LOG_DEBUG("notebook", "Appended tab {} at index {}", ref.id(), tabs_.size() - 1);

    if (on_tab_added_)
        on_tab_added_(ref);

    set_current(tabs_.size() - 1);
    return ref;
}

std::unique_ptr<Tab> Notebook::remove(const Tab* tab)
{
    auto index = index_of(tab);
    if (!index)
        return nullptr;

    const size_t removed = *index;
    auto         owned   = std::move(tabs_[removed]);
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(removed));

    TERMDECK_LOG_DEBUG("notebook", "Removed tab {} from index {}", owned->id(), removed);

    // Selection repair
    if (tabs_.empty())
    {
        set_current(std::nullopt);
    }
    else if (current_ && removed < *current_)
    {
        // Same tab stays selected; only its index moved. No change notification.
        current_ = *current_ - 1;
    }
    else if (current_ && removed == *current_)
    {
        // The index may be unchanged while the tab behind it is not.
        current_.reset();
        set_current(removed < tabs_.size() ? removed : tabs_.size() - 1);
    }

    if (on_tab_removed_)
        on_tab_removed_(owned->id());

    return owned;
}

std::vector<std::unique_ptr<Tab>> Notebook::take_all()
{
    std::vector<std::unique_ptr<Tab>> taken;
    taken.reserve(tabs_.size());
    set_current(std::nullopt);
    while (!tabs_.empty())
    {
        taken.push_back(std::move(tabs_.back()));
        tabs_.pop_back();
        if (on_tab_removed_)
            on_tab_removed_(taken.back()->id());
    }
    return taken;
}

bool Notebook::select(size_t index)
{
    if (index >= tabs_.size())
        return false;
    set_current(index);
    return true;
}

bool Notebook::goto_next()
{
    if (!current_)
        return false;
    return select(*current_ + 1);
}

bool Notebook::goto_previous()
{
    if (!current_ || *current_ == 0)
        return false;
    return select(*current_ - 1);
}

bool Notebook::goto_next_from(const Tab& tab)
{
    auto index = index_of(&tab);
    if (!index)
        return false;
    return select(*index + 1);
}

bool Notebook::goto_previous_from(const Tab& tab)
{
    auto index = index_of(&tab);
    if (!index || *index == 0)
        return false;
    return select(*index - 1);
}

bool Notebook::goto_nth(size_t n)
{
    if (n == 0)
        return false;
    return select(n - 1);
}

bool Notebook::goto_last()
{
    return select(tabs_.empty() ? 0 : tabs_.size() - 1);
}

void Notebook::move_tab(size_t from_index, size_t to_index)
{
    if (from_index >= tabs_.size() || to_index >= tabs_.size() || from_index == to_index)
        return;

    auto tab = std::move(tabs_[from_index]);
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(from_index));
    tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(to_index), std::move(tab));

    if (!current_)
        return;

    size_t& active = *current_;
    if (active == from_index)
    {
        active = to_index;
    }
    else if (from_index < to_index)
    {
        if (active > from_index && active <= to_index)
            --active;
    }
    else
    {
        if (active >= to_index && active < from_index)
            ++active;
    }
}

Tab* Notebook::current_tab() const
{
    return current_ ? tabs_[*current_].get() : nullptr;
}

Tab* Notebook::tab_at(size_t index) const
{
    return index < tabs_.size() ? tabs_[index].get() : nullptr;
}

std::optional<size_t> Notebook::index_of(const Tab* tab) const
{
    if (!tab)
        return std::nullopt;
    for (size_t i = 0; i < tabs_.size(); ++i)
    {
        if (tabs_[i].get() == tab)
            return i;
    }
    return std::nullopt;
}

Tab* Notebook::find(TabId id) const
{
    for (const auto& tab : tabs_)
    {
        if (tab->id() == id)
            return tab.get();
    }
    return nullptr;
}

Tab* Notebook::tab_for_surface(const Surface* surface) const
{
    if (!surface)
        return nullptr;
    for (const auto& tab : tabs_)
    {
        if (tab->contains(surface))
            return tab.get();
    }
    return nullptr;
}

std::vector<Tab*> Notebook::tabs() const
{
    std::vector<Tab*> result;
    result.reserve(tabs_.size());
    for (const auto& tab : tabs_)
        result.push_back(tab.get());
    return result;
}

void Notebook::set_current(std::optional<size_t> index)
{
    if (index == current_)
        return;
    current_ = index;
    if (on_current_changed_)
        on_current_changed_(current_tab());
}

}   // namespace termdeck
