#pragma once

#include <functional>
#include <memory>
#include <string_view>
#include <termdeck/fwd.hpp>
#include <vector>

#include "toolkit.hpp"

namespace termdeck
{

enum class CloseState
{
    Idle,                   // window open, accepting events
    Evaluating,             // querying surfaces
    AwaitingUserResponse,   // prompt shown, waiting for yes/no
    Closing,                // terminal: window is being destroyed
};

std::string_view close_state_name(CloseState state);

/**
 * CloseConfirmation — Per-window state machine gating window closure.
 *
 * begin() asks every surface whether it needs confirmation. If none does,
 * the workflow goes straight to Closing and runs the confirmed callback.
 * Otherwise a yes/no prompt is shown and the workflow parks in
 * AwaitingUserResponse until the toolkit reports the answer.
 *
 * The prompt callback only holds a weak reference to the pending request.
 * cancel() (called on every destroy path) drops that request and dismisses
 * the dialog, so a late answer can never reach a destroyed window.
 */
class CloseConfirmation
{
   public:
    using ConfirmedCallback = std::function<void()>;

    CloseConfirmation() = default;
    ~CloseConfirmation();

    CloseConfirmation(const CloseConfirmation&)            = delete;
    CloseConfirmation& operator=(const CloseConfirmation&) = delete;

    // Start the workflow. Ignored unless Idle. Returns the resulting state.
    CloseState begin(ToolkitWindow&               toolkit,
                     const std::vector<Surface*>& surfaces,
                     ConfirmedCallback            on_confirmed);

    // Invalidate any pending prompt. Leaves Closing untouched.
    void cancel();

    CloseState state() const { return state_; }
    bool       awaiting_response() const { return state_ == CloseState::AwaitingUserResponse; }

    // The question shown to the user.
    static PromptRequest prompt_request();

   private:
    struct PendingPrompt
    {
        ConfirmedCallback on_confirmed;
    };

    void resolve(PromptResponse response);

    CloseState                     state_   = CloseState::Idle;
    ToolkitWindow*                 toolkit_ = nullptr;
    std::shared_ptr<PendingPrompt> pending_;
};

}   // namespace termdeck
