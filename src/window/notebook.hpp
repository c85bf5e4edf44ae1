#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <termdeck/fwd.hpp>
#include <vector>

#include "tab.hpp"

namespace termdeck
{

/**
 * Notebook — Ordered tab collection with a single current selection.
 *
 * Insertion order is navigation order. Whenever the notebook holds at least
 * one tab, current_index() is a valid index; when empty it is unset.
 * Navigation clamps at both ends and never wraps. Out-of-range requests are
 * no-ops, not errors.
 */
class Notebook
{
   public:
    using CurrentChangedCallback = std::function<void(Tab* tab)>;   // nullptr when emptied
    using TabAddedCallback       = std::function<void(Tab& tab)>;
    using TabRemovedCallback     = std::function<void(TabId id)>;

    Notebook()  = default;
    ~Notebook() = default;

    Notebook(const Notebook&)            = delete;
    Notebook& operator=(const Notebook&) = delete;

    // Append at the end and make it current.
    Tab& append(std::unique_ptr<Tab> tab);

    // Detach a tab and repair the selection: the tab that shifts into the
    // vacated slot becomes current, or the new last tab if none did.
    // Returns nullptr if the tab is not in this notebook.
    std::unique_ptr<Tab> remove(const Tab* tab);

    // Detach every tab (last first). Selection becomes unset.
    std::vector<std::unique_ptr<Tab>> take_all();

    // Navigation. Each returns true if the target index exists, in which case
    // it is now current.
    bool select(size_t index);
    bool goto_next();
    bool goto_previous();
    bool goto_next_from(const Tab& tab);
    bool goto_previous_from(const Tab& tab);
    bool goto_nth(size_t n);   // 1-based; 0 is reserved and never selects
    bool goto_last();

    // Reorder; the selection follows the tab it pointed at.
    void move_tab(size_t from_index, size_t to_index);

    // Queries
    size_t                count() const { return tabs_.size(); }
    bool                  empty() const { return tabs_.empty(); }
    std::optional<size_t> current_index() const { return current_; }
    Tab*                  current_tab() const;
    Tab*                  tab_at(size_t index) const;
    std::optional<size_t> index_of(const Tab* tab) const;
    Tab*                  find(TabId id) const;
    Tab*                  tab_for_surface(const Surface* surface) const;
    std::vector<Tab*>     tabs() const;

    // Callbacks
    void set_on_current_changed(CurrentChangedCallback cb) { on_current_changed_ = std::move(cb); }
    void set_on_tab_added(TabAddedCallback cb) { on_tab_added_ = std::move(cb); }
    void set_on_tab_removed(TabRemovedCallback cb) { on_tab_removed_ = std::move(cb); }

   private:
    std::vector<std::unique_ptr<Tab>> tabs_;
    std::optional<size_t>             current_;

    CurrentChangedCallback on_current_changed_;
    TabAddedCallback       on_tab_added_;
    TabRemovedCallback     on_tab_removed_;

    void set_current(std::optional<size_t> index);
};

}   // namespace termdeck
