#include "action_dispatcher.hpp"

#include <termdeck/logger.hpp>
#include <termdeck/surface.hpp>

namespace termdeck
{

ActionResult ActionDispatcher::dispatch(Surface* surface, Action action)
{
    if (!surface)
    {
        // Menu and keybinding events can race window teardown.
        TERMDECK_LOG_DEBUG("dispatch", "No focused surface, dropping {}", action_name(action));
        return ActionResult::NoSurface;
    }

    BindingResult result = surface->perform_binding_action(action);
    if (!result.ok)
    {
        TERMDECK_LOG_WARN("dispatch",
                          "error performing binding action {}: {}",
                          action_name(action),
                          result.error);
        return ActionResult::Rejected;
    }

    TERMDECK_LOG_TRACE("dispatch", "Performed {}", action_name(action));

    auto ack = acknowledgment(action);
    if (!ack.empty() && notify_)
        notify_(std::string(ack));

    return ActionResult::Performed;
}

ActionResult ActionDispatcher::dispatch(Surface* surface, std::string_view action_id)
{
    auto action = parse_action(action_id);
    if (!action)
    {
        TERMDECK_LOG_WARN("dispatch", "Unknown action \"{}\"", action_id);
        return ActionResult::Unknown;
    }
    return dispatch(surface, *action);
}

std::string_view ActionDispatcher::acknowledgment(Action action)
{
    switch (action)
    {
        case Action::CopyToClipboard:
            return "Copied to clipboard";
        default:
            return {};
    }
}

}   // namespace termdeck
