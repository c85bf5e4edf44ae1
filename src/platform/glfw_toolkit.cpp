#ifdef TERMDECK_USE_GLFW

    #include "glfw_toolkit.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <imgui.h>
    #include <termdeck/logger.hpp>

namespace termdeck
{

namespace
{

constexpr const char* PROMPT_POPUP_ID = "##termdeck_close_prompt";
constexpr const char* ABOUT_POPUP_ID  = "About termdeck";

const ImVec4 DESTRUCTIVE_COLOR       = ImVec4(0.75f, 0.18f, 0.16f, 1.0f);
const ImVec4 DESTRUCTIVE_HOVER_COLOR = ImVec4(0.85f, 0.25f, 0.22f, 1.0f);

}   // namespace

// ─── GlfwToolkitWindow ───────────────────────────────────────────────────────

GlfwToolkitWindow::GlfwToolkitWindow(GLFWwindow* window, const WindowChrome& chrome)
    : window_(window), chrome_(chrome), titlebar_visible_(chrome.titlebar && chrome.decorated)
{
    glfwSetWindowUserPointer(window_, this);
    glfwSetWindowCloseCallback(window_, close_callback);
    glfwSetKeyCallback(window_, key_callback);
    glfwGetWindowPos(window_, &windowed_x_, &windowed_y_);
    glfwGetWindowSize(window_, &windowed_w_, &windowed_h_);

    if (chrome_.fullscreen)
        set_fullscreen(true);
}

GlfwToolkitWindow::~GlfwToolkitWindow()
{
    // Deferred from close(): GLFW forbids destroying a window inside its own callbacks.
    if (window_)
    {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

void GlfwToolkitWindow::set_event_handler(WindowEventHandler handler)
{
    handler_ = std::move(handler);
}

void GlfwToolkitWindow::emit(const WindowEvent& event)
{
    if (closed_)
        return;
    auto handler = handler_;
    if (handler)
        handler(event);
}

void GlfwToolkitWindow::set_title(const std::string& title)
{
    chrome_.title = title;
    if (!closed_)
        glfwSetWindowTitle(window_, title.c_str());
}

void GlfwToolkitWindow::set_fullscreen(bool fullscreen)
{
    if (closed_)
        return;

    if (fullscreen)
    {
        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        if (!monitor)
        {
            TERMDECK_LOG_WARN("glfw", "No primary monitor, staying windowed");
            return;
        }
        const GLFWvidmode* mode = glfwGetVideoMode(monitor);
        if (!mode)
        {
            TERMDECK_LOG_WARN("glfw", "No video mode for primary monitor");
            return;
        }
        glfwGetWindowPos(window_, &windowed_x_, &windowed_y_);
        glfwGetWindowSize(window_, &windowed_w_, &windowed_h_);
        glfwSetWindowMonitor(
            window_, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
    }
    else
    {
        glfwSetWindowMonitor(
            window_, nullptr, windowed_x_, windowed_y_, windowed_w_, windowed_h_, GLFW_DONT_CARE);
    }
    chrome_.fullscreen = fullscreen;
}

void GlfwToolkitWindow::set_decorated(bool decorated)
{
    chrome_.decorated = decorated;
    if (!closed_)
        glfwSetWindowAttrib(window_, GLFW_DECORATED, decorated ? GLFW_TRUE : GLFW_FALSE);
}

void GlfwToolkitWindow::set_region_visible(ChromeRegion region, bool visible)
{
    switch (region)
    {
        case ChromeRegion::TitleBar:
            titlebar_visible_ = visible;
            break;
        case ChromeRegion::TabBar:
            tabbar_visible_ = visible;
            break;
    }
}

void GlfwToolkitWindow::add_tab_page(TabId id)
{
    tab_pages_.push_back(id);
}

void GlfwToolkitWindow::remove_tab_page(TabId id)
{
    std::erase(tab_pages_, id);
    if (selected_page_ == id)
        selected_page_ = INVALID_TAB_ID;
}

void GlfwToolkitWindow::select_tab_page(TabId id)
{
    selected_page_ = id;
}

void GlfwToolkitWindow::show_prompt(const PromptRequest& request, PromptCallback callback)
{
    if (prompt_)
        TERMDECK_LOG_WARN("glfw", "Replacing a pending prompt");
    prompt_ = Prompt{request, std::move(callback), false};
}

void GlfwToolkitWindow::cancel_prompt()
{
    prompt_.reset();
}

void GlfwToolkitWindow::resolve_prompt(PromptResponse response)
{
    if (!prompt_)
        return;
    auto callback = std::move(prompt_->callback);
    prompt_.reset();
    if (callback)
        callback(response);
}

void GlfwToolkitWindow::show_notification(const std::string& text, int timeout_seconds)
{
    toasts_.push_back(
        {text, std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds)});
}

void GlfwToolkitWindow::show_about()
{
    about_requested_ = true;
}

void GlfwToolkitWindow::present()
{
    if (closed_)
        return;
    glfwShowWindow(window_);
    glfwFocusWindow(window_);
}

void GlfwToolkitWindow::close()
{
    if (closed_)
        return;
    closed_  = true;
    handler_ = nullptr;
    prompt_.reset();
    toasts_.clear();
    glfwHideWindow(window_);
}

// ─── Static callback trampolines ─────────────────────────────────────────────

void GlfwToolkitWindow::close_callback(GLFWwindow* window)
{
    auto* self = static_cast<GlfwToolkitWindow*>(glfwGetWindowUserPointer(window));
    // The controller decides; the close may still be refused at the prompt.
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    if (self)
        self->emit(events::CloseRequested{});
}

void GlfwToolkitWindow::key_callback(GLFWwindow* window,
                                     int         key,
                                     int /*scancode*/,
                                     int action,
                                     int mods)
{
    auto* self = static_cast<GlfwToolkitWindow*>(glfwGetWindowUserPointer(window));
    if (!self || action == GLFW_RELEASE)
        return;

    if (self->prompt_)
    {
        // The prompt is modal: only its own keys are honoured. The answer is
        // applied in draw_prompt() so the popup is closed inside the frame.
        if (key == GLFW_KEY_ESCAPE)
            self->prompt_->key_answer = PromptResponse::Dismissed;
        else if (key == GLFW_KEY_ENTER || key == GLFW_KEY_KP_ENTER)
            self->prompt_->key_answer = self->prompt_->request.default_response;
        return;
    }

    if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureKeyboard)
        return;

    // GLFW modifier bits already match KeyMod
    self->emit(events::KeyPressed{key, mods & 0x0F});
}

// ─── ImGui overlays ──────────────────────────────────────────────────────────

void GlfwToolkitWindow::draw_overlays()
{
    if (closed_)
        return;

    draw_chrome();
    if (closed_)
        return;
    draw_tab_overview();
    if (closed_)
        return;
    draw_prompt();
    if (closed_)
        return;
    draw_about();
    draw_toasts();
}

void GlfwToolkitWindow::draw_chrome()
{
    const bool show_title = chrome_.titlebar && titlebar_visible_;
    if (!show_title && !tabbar_visible_)
        return;

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    const bool     at_bottom = chrome_.tabs_location == TabsLocation::Bottom;
    ImGui::SetNextWindowPos(at_bottom ? ImVec2(viewport->WorkPos.x,
                                               viewport->WorkPos.y + viewport->WorkSize.y)
                                      : viewport->WorkPos,
                            ImGuiCond_Always,
                            at_bottom ? ImVec2(0.0f, 1.0f) : ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, 0.0f));

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                             | ImGuiWindowFlags_NoSavedSettings
                             | ImGuiWindowFlags_AlwaysAutoResize;
    if (!ImGui::Begin("##termdeck_chrome", nullptr, flags))
    {
        ImGui::End();
        return;
    }

    // Events below may close this window; collect them and emit after End().
    bool new_tab_clicked = false;
    bool about_clicked   = false;

    if (show_title)
    {
        ImGui::TextUnformatted(chrome_.title.c_str());
        ImGui::SameLine();
        if (ImGui::SmallButton("+"))
            new_tab_clicked = true;
        if (chrome_.tab_overview)
        {
            ImGui::SameLine();
            if (ImGui::SmallButton("Tabs"))
                overview_open_ = !overview_open_;
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("About"))
            about_clicked = true;
    }

    if (tabbar_visible_ && !tab_pages_.empty())
    {
        ImGuiTabBarFlags tab_flags = ImGuiTabBarFlags_None;
        if (chrome_.wide_tabs)
            tab_flags |= ImGuiTabBarFlags_FittingPolicyResizeDown;
        else
            tab_flags |= ImGuiTabBarFlags_FittingPolicyScroll;

        if (ImGui::BeginTabBar("##termdeck_tabs", tab_flags))
        {
            for (size_t i = 0; i < tab_pages_.size(); ++i)
            {
                const TabId id    = tab_pages_[i];
                std::string label = "Tab " + std::to_string(i + 1) + "##" + std::to_string(id);
                ImGuiTabItemFlags item_flags =
                    id == selected_page_ ? ImGuiTabItemFlags_SetSelected : ImGuiTabItemFlags_None;
                if (ImGui::BeginTabItem(label.c_str(), nullptr, item_flags))
                    ImGui::EndTabItem();
            }
            ImGui::EndTabBar();
        }
    }
    ImGui::End();

    if (new_tab_clicked)
        emit(events::NewTabClicked{});
    if (about_clicked && !closed_)
        emit(events::AboutRequested{});
}

void GlfwToolkitWindow::draw_tab_overview()
{
    if (!chrome_.tab_overview || !overview_open_)
        return;

    bool create = false;
    ImGui::SetNextWindowSize(ImVec2(320.0f, 0.0f), ImGuiCond_Appearing);
    if (ImGui::Begin("Tab overview", &overview_open_, ImGuiWindowFlags_NoSavedSettings))
    {
        for (size_t i = 0; i < tab_pages_.size(); ++i)
        {
            const bool selected = tab_pages_[i] == selected_page_;
            ImGui::Text("%s Tab %zu", selected ? ">" : " ", i + 1);
        }
        ImGui::Separator();
        if (ImGui::Button("New tab"))
        {
            create         = true;
            overview_open_ = false;
        }
    }
    ImGui::End();

    if (create)
        emit(events::TabCreatedFromOverview{});
}

void GlfwToolkitWindow::draw_prompt()
{
    if (!prompt_)
        return;

    if (!prompt_->opened)
    {
        ImGui::OpenPopup(PROMPT_POPUP_ID);
        prompt_->opened = true;
    }

    std::optional<PromptResponse> answer;
    if (ImGui::BeginPopupModal(PROMPT_POPUP_ID, nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        const PromptRequest& req = prompt_->request;
        ImGui::TextUnformatted(req.heading.c_str());
        ImGui::Separator();
        ImGui::TextUnformatted(req.body.c_str());
        ImGui::Spacing();

        if (req.yes_is_destructive)
        {
            ImGui::PushStyleColor(ImGuiCol_Button, DESTRUCTIVE_COLOR);
            ImGui::PushStyleColor(ImGuiCol_ButtonHovered, DESTRUCTIVE_HOVER_COLOR);
        }
        if (ImGui::Button(req.yes_label.c_str()))
            answer = PromptResponse::Yes;
        if (req.default_response == PromptResponse::Yes)
            ImGui::SetItemDefaultFocus();
        if (req.yes_is_destructive)
            ImGui::PopStyleColor(2);

        ImGui::SameLine();
        if (ImGui::Button(req.no_label.c_str()))
            answer = PromptResponse::No;
        if (req.default_response != PromptResponse::Yes)
            ImGui::SetItemDefaultFocus();

        if (!answer)
            answer = prompt_->key_answer;
        if (answer)
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
    else if (prompt_->key_answer)
    {
        answer = prompt_->key_answer;
    }

    if (answer)
        resolve_prompt(*answer);
}

void GlfwToolkitWindow::draw_about()
{
    if (about_requested_)
    {
        ImGui::OpenPopup(ABOUT_POPUP_ID);
        about_requested_ = false;
    }
    if (ImGui::BeginPopupModal(ABOUT_POPUP_ID, nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::TextUnformatted("termdeck");
        ImGui::TextUnformatted("A tabbed terminal window shell.");
        if (ImGui::Button("Close"))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}

void GlfwToolkitWindow::draw_toasts()
{
    const auto now = std::chrono::steady_clock::now();
    std::erase_if(toasts_, [now](const Toast& t) { return t.expires <= now; });
    if (toasts_.empty())
        return;

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x + viewport->WorkSize.x * 0.5f,
                                   viewport->WorkPos.y + viewport->WorkSize.y - 24.0f),
                            ImGuiCond_Always,
                            ImVec2(0.5f, 1.0f));
    ImGui::SetNextWindowBgAlpha(0.85f);
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                             | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoInputs
                             | ImGuiWindowFlags_AlwaysAutoResize;
    if (ImGui::Begin("##termdeck_toasts", nullptr, flags))
    {
        for (const auto& toast : toasts_)
            ImGui::TextUnformatted(toast.text.c_str());
    }
    ImGui::End();
}

// ─── GlfwToolkit ─────────────────────────────────────────────────────────────

GlfwToolkit::GlfwToolkit(bool enhanced) : enhanced_(enhanced) {}

GlfwToolkit::~GlfwToolkit()
{
    if (initialized_)
        glfwTerminate();
}

bool GlfwToolkit::init()
{
    if (initialized_)
        return true;
    if (!glfwInit())
    {
        TERMDECK_LOG_ERROR("glfw", "Failed to initialize GLFW");
        return false;
    }
    initialized_ = true;
    return true;
}

std::unique_ptr<ToolkitWindow> GlfwToolkit::create_window(const WindowChrome& chrome)
{
    if (!initialized_)
    {
        TERMDECK_LOG_ERROR("glfw", "create_window called before init()");
        return nullptr;
    }

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_DECORATED, chrome.decorated ? GLFW_TRUE : GLFW_FALSE);

    GLFWwindow* window =
        glfwCreateWindow(chrome.width, chrome.height, chrome.title.c_str(), nullptr, nullptr);
    if (!window)
    {
        TERMDECK_LOG_ERROR("glfw", "Failed to create GLFW window");
        return nullptr;
    }

    TERMDECK_LOG_DEBUG("glfw", "Created GLFW window {}x{}", chrome.width, chrome.height);
    return std::make_unique<GlfwToolkitWindow>(window, chrome);
}

void GlfwToolkit::poll_events()
{
    glfwPollEvents();
}

void GlfwToolkit::wait_events()
{
    glfwWaitEvents();
}

}   // namespace termdeck

#endif   // TERMDECK_USE_GLFW
