#pragma once

#ifdef TERMDECK_USE_GLFW

    #include <chrono>
    #include <deque>
    #include <memory>
    #include <optional>
    #include <string>
    #include <vector>

    #include "window/toolkit.hpp"

struct GLFWwindow;

namespace termdeck
{

// Toolkit adapter on plain GLFW windows. Chrome (title bar, tab bar, tab
// overview), the close prompt and notifications are drawn with Dear ImGui by
// draw_overlays(), which the host calls once per frame for each window
// between ImGui::NewFrame() and ImGui::Render().
class GlfwToolkitWindow : public ToolkitWindow
{
   public:
    explicit GlfwToolkitWindow(GLFWwindow* window, const WindowChrome& chrome);
    ~GlfwToolkitWindow() override;

    GlfwToolkitWindow(const GlfwToolkitWindow&)            = delete;
    GlfwToolkitWindow& operator=(const GlfwToolkitWindow&) = delete;

    void set_event_handler(WindowEventHandler handler) override;
    void set_title(const std::string& title) override;
    void set_fullscreen(bool fullscreen) override;
    void set_decorated(bool decorated) override;
    void set_region_visible(ChromeRegion region, bool visible) override;

    void add_tab_page(TabId id) override;
    void remove_tab_page(TabId id) override;
    void select_tab_page(TabId id) override;

    void show_prompt(const PromptRequest& request, PromptCallback callback) override;
    void cancel_prompt() override;
    void show_notification(const std::string& text, int timeout_seconds) override;
    void show_about() override;
    void present() override;
    void close() override;

    void draw_overlays();

    GLFWwindow* native_window() const { return window_; }
    bool        closed() const { return closed_; }
    bool        prompt_pending() const { return prompt_.has_value(); }

   private:
    struct Prompt
    {
        PromptRequest  request;
        PromptCallback callback;
        bool           opened = false;

        std::optional<PromptResponse> key_answer;   // Enter/Escape, applied next frame
    };

    struct Toast
    {
        std::string                           text;
        std::chrono::steady_clock::time_point expires;
    };

    void emit(const WindowEvent& event);
    void resolve_prompt(PromptResponse response);

    void draw_chrome();
    void draw_tab_overview();
    void draw_prompt();
    void draw_toasts();
    void draw_about();

    static void close_callback(GLFWwindow* window);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);

    GLFWwindow*        window_;
    WindowChrome       chrome_;
    WindowEventHandler handler_;
    bool               closed_ = false;

    bool titlebar_visible_ = true;
    bool tabbar_visible_   = true;
    bool overview_open_    = false;
    bool about_requested_  = false;

    std::vector<TabId>    tab_pages_;
    TabId                 selected_page_ = INVALID_TAB_ID;
    std::optional<Prompt> prompt_;
    std::deque<Toast>     toasts_;

    // Windowed geometry restored when leaving fullscreen
    int windowed_x_ = 0;
    int windowed_y_ = 0;
    int windowed_w_ = 0;
    int windowed_h_ = 0;
};

class GlfwToolkit : public Toolkit
{
   public:
    // enhanced: offer the tab overview and notifications
    explicit GlfwToolkit(bool enhanced = true);
    ~GlfwToolkit() override;

    GlfwToolkit(const GlfwToolkit&)            = delete;
    GlfwToolkit& operator=(const GlfwToolkit&) = delete;

    // Initialize GLFW. Must succeed before create_window().
    bool init();

    std::unique_ptr<ToolkitWindow> create_window(const WindowChrome& chrome) override;
    bool supports_enhanced_chrome() const override { return enhanced_; }

    void poll_events();
    void wait_events();

   private:
    bool enhanced_;
    bool initialized_ = false;
};

}   // namespace termdeck

#endif   // TERMDECK_USE_GLFW
