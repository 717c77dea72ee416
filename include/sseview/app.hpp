#pragma once

#include "sseview/protocol/client.hpp"
#include "sseview/views/connection_panel.hpp"
#include "sseview/views/event_log.hpp"

#include <memory>
#include <optional>

namespace sseview {

/// Application entry point and lifecycle management.
/// Initializes Hello ImGui, starts the SSE client, and runs the render loop.
class App {
  public:
    explicit App(protocol::ClientConfig config = {});
    ~App();

    /// Run the main application loop.
    /// Returns exit code (0 = success).
    int run(int argc, char *argv[]);

  private:
    /// UI rendering functions (called each frame).
    void render_connection_status();
    void render_connection_window();
    void render_broadcast_window();
    void render_events_window();

    void handle_action(std::optional<views::PanelAction> action);

    // --- State ---
    protocol::ClientConfig config_;
    std::unique_ptr<protocol::SseClient> client_;
    views::ConnectionPanelState panel_state_;
    views::BroadcastDraft draft_;
    views::EventLogView event_log_;
};

} // namespace sseview
