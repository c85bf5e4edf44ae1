#include "close_confirmation.hpp"

#include <algorithm>
#include <termdeck/logger.hpp>
#include <termdeck/surface.hpp>

namespace termdeck
{

std::string_view close_state_name(CloseState state)
{
    switch (state)
    {
        case CloseState::Idle:
            return "idle";
        case CloseState::Evaluating:
            return "evaluating";
        case CloseState::AwaitingUserResponse:
            return "awaiting_user_response";
        case CloseState::Closing:
            return "closing";
    }
    return "unknown";
}

CloseConfirmation::~CloseConfirmation()
{
    cancel();
}

CloseState CloseConfirmation::begin(ToolkitWindow&               toolkit,
                                    const std::vector<Surface*>& surfaces,
                                    ConfirmedCallback            on_confirmed)
{
    if (state_ != CloseState::Idle)
    {
        TERMDECK_LOG_DEBUG("close_confirm",
                           "Close request ignored while {}",
                           close_state_name(state_));
        return state_;
    }

    state_   = CloseState::Evaluating;
    toolkit_ = &toolkit;

    bool needs_confirm = std::any_of(surfaces.begin(),
                                     surfaces.end(),
                                     [](const Surface* s) { return s && s->needs_confirm_quit(); });

    if (!needs_confirm)
    {
        TERMDECK_LOG_DEBUG("close_confirm", "No surface needs confirmation, closing");
        state_ = CloseState::Closing;
        if (on_confirmed)
            on_confirmed();
        return state_;
    }

    pending_ = std::make_shared<PendingPrompt>(PendingPrompt{std::move(on_confirmed)});
    state_   = CloseState::AwaitingUserResponse;

    std::weak_ptr<PendingPrompt> weak = pending_;
    toolkit.show_prompt(prompt_request(),
                        [this, weak](PromptResponse response)
                        {
                            // `this` is alive whenever the pending request is:
                            // only this object owns it.
                            if (auto pending = weak.lock())
                                resolve(response);
                            else
                                TERMDECK_LOG_DEBUG("close_confirm",
                                                   "Ignoring answer to a cancelled prompt");
                        });

    TERMDECK_LOG_DEBUG("close_confirm", "Awaiting user response");
    return state_;
}

void CloseConfirmation::cancel()
{
    if (pending_)
    {
        pending_.reset();
        if (toolkit_)
            toolkit_->cancel_prompt();
        TERMDECK_LOG_DEBUG("close_confirm", "Pending prompt cancelled");
    }
    if (state_ != CloseState::Closing)
        state_ = CloseState::Idle;
}

void CloseConfirmation::resolve(PromptResponse response)
{
    auto pending = std::move(pending_);
    if (!pending || state_ != CloseState::AwaitingUserResponse)
        return;

    if (response == PromptResponse::Yes)
    {
        TERMDECK_LOG_DEBUG("close_confirm", "User confirmed close");
        state_ = CloseState::Closing;
        if (pending->on_confirmed)
            pending->on_confirmed();
        return;
    }

    TERMDECK_LOG_DEBUG("close_confirm", "User kept the window open");
    state_ = CloseState::Idle;
}

PromptRequest CloseConfirmation::prompt_request()
{
    PromptRequest req;
    req.heading            = "Close this window?";
    req.body               = "All terminal sessions in this window will be terminated.";
    req.yes_is_destructive = true;
    req.default_response   = PromptResponse::No;
    return req;
}

}   // namespace termdeck
