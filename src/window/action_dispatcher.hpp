#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <termdeck/action.hpp>
#include <termdeck/fwd.hpp>

namespace termdeck
{

// Routes binding actions to a surface. Holds no surface references between
// calls. Engine failures are logged and reported as Rejected, never thrown.
class ActionDispatcher
{
   public:
    using NotifyCallback = std::function<void(const std::string& text)>;

    ActionDispatcher()  = default;
    ~ActionDispatcher() = default;

    ActionDispatcher(const ActionDispatcher&)            = delete;
    ActionDispatcher& operator=(const ActionDispatcher&) = delete;

    // A null surface is a no-op (NoSurface), not a failure.
    ActionResult dispatch(Surface* surface, Action action);

    // Same, by identifier. Unrecognized identifiers yield Unknown.
    ActionResult dispatch(Surface* surface, std::string_view action_id);

    // Installed only when the window can show lightweight notifications.
    void set_notify_callback(NotifyCallback cb) { notify_ = std::move(cb); }
    bool has_notify_callback() const { return static_cast<bool>(notify_); }

    // Text shown after a successful action, or empty if none.
    static std::string_view acknowledgment(Action action);

   private:
    NotifyCallback notify_;
};

}   // namespace termdeck
