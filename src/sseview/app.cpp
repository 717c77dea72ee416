#include "sseview/app.hpp"

#include "sseview/protocol/endpoint.hpp"

#include <GLFW/glfw3.h>
#include <hello_imgui/hello_imgui.h>
#include <imgui.h>

#include <cstdio>
#include <cstdlib>
#include <utility>

namespace sseview {

App::App(protocol::ClientConfig config) : config_(std::move(config)) {}
App::~App() = default;

int App::run(int /*argc*/, char * /*argv*/[]) {
    // Register GLFW error callback before initialization for diagnostics.
    glfwSetErrorCallback([](int error, const char *description) {
        std::fprintf(stderr, "[GLFW Error %d] %s\n", error, description);
    });

    // Force X11 on WSL2/WSLg, whose Wayland EGL is unreliable.
    if (std::getenv("WSL_DISTRO_NAME") != nullptr && std::getenv("GLFW_PLATFORM") == nullptr) {
        unsetenv("WAYLAND_DISPLAY");
    }

    client_ = std::make_unique<protocol::SseClient>(config_);
    panel_state_.stream_url = protocol::join_url(config_.base_url, protocol::kStreamPath);
    panel_state_.token = config_.token;
    panel_state_.auto_connect = config_.auto_connect;

    HelloImGui::RunnerParams runner_params;
    runner_params.appWindowParams.windowTitle = "SseView";
    runner_params.appWindowParams.windowGeometry.size = {1100, 720};

    runner_params.imGuiWindowParams.defaultImGuiWindowType =
        HelloImGui::DefaultImGuiWindowType::ProvideFullScreenDockSpace;
    runner_params.imGuiWindowParams.showMenuBar = true;
    runner_params.imGuiWindowParams.showMenu_App = false;
    runner_params.imGuiWindowParams.showMenu_View = false;
    runner_params.imGuiWindowParams.showStatusBar = true;

    // Backoff countdowns and incoming events must render without input.
    runner_params.fpsIdling.enableIdling = false;

    // Define docking layout
    //  ___________________________________________
    //  |              |                           |
    //  | Connection   |    MainDockSpace          |
    //  |--------------|    (events)               |
    //  | Broadcast    |                           |
    //  -------------------------------------------
    HelloImGui::DockingSplit split_left;
    split_left.initialDock = "MainDockSpace";
    split_left.newDock = "ConnectionSpace";
    split_left.direction = ImGuiDir_Left;
    split_left.ratio = 0.33f;

    HelloImGui::DockingSplit split_bottom;
    split_bottom.initialDock = "ConnectionSpace";
    split_bottom.newDock = "BroadcastSpace";
    split_bottom.direction = ImGuiDir_Down;
    split_bottom.ratio = 0.5f;
    runner_params.dockingParams.dockingSplits = {split_left, split_bottom};

    HelloImGui::DockableWindow connection_window;
    connection_window.label = "Connection";
    connection_window.dockSpaceName = "ConnectionSpace";
    connection_window.GuiFunction = [this] { render_connection_window(); };

    HelloImGui::DockableWindow broadcast_window;
    broadcast_window.label = "Broadcast";
    broadcast_window.dockSpaceName = "BroadcastSpace";
    broadcast_window.GuiFunction = [this] { render_broadcast_window(); };

    HelloImGui::DockableWindow events_window;
    events_window.label = "Events";
    events_window.dockSpaceName = "MainDockSpace";
    events_window.GuiFunction = [this] { render_events_window(); };

    runner_params.dockingParams.dockableWindows = {connection_window, broadcast_window,
                                                   events_window};

    runner_params.callbacks.ShowStatus = [this] { render_connection_status(); };

    // Per-frame processing: drain transport events and fire reconnect timers
    runner_params.callbacks.BeforeImGuiRender = [this] { client_->poll(); };

    // Connect on startup when auto-connect is enabled
    runner_params.callbacks.PostInit = [this] { client_->start(); };

    runner_params.callbacks.BeforeExit = [this] { client_->disconnect(); };

    HelloImGui::Run(runner_params);

    client_.reset();
    return 0;
}

void App::render_connection_status() {
    views::render_status_badge(client_->connected(), client_->status_text());
}

void App::render_connection_window() {
    panel_state_.attempts = client_->attempts();
    handle_action(views::render_connection_panel(panel_state_));
}

void App::render_broadcast_window() { handle_action(views::render_broadcast_panel(draft_)); }

void App::render_events_window() { event_log_.render(client_->records()); }

void App::handle_action(std::optional<views::PanelAction> action) {
    if (!action.has_value()) {
        return;
    }

    switch (action.value()) {
    case views::PanelAction::Connect:
        client_->connect();
        break;
    case views::PanelAction::Disconnect:
        client_->disconnect();
        break;
    case views::PanelAction::ToggleAutoConnect:
        client_->set_auto_connect(panel_state_.auto_connect);
        std::printf("[SseView] Auto-connect %s\n", panel_state_.auto_connect ? "on" : "off");
        break;
    case views::PanelAction::Send:
        client_->send_broadcast(draft_.text());
        break;
    }
}

} // namespace sseview
