#ifndef FLOW_VIEW_APP_HPP
#define FLOW_VIEW_APP_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "capture_engine.hpp"
#include "flow_view.hpp"
#include "ingestion_queue.hpp"
#include "view_commands.hpp"
#include "view_options.hpp"

struct AppConfig
{
    std::vector<std::string> files;  // pcap files loaded before anything else
    std::string interface;           // live capture when not empty
    std::string bpf_filter;
    ViewOptions view_options;
};

class FlowViewApp
{
   public:
    // Applies the view options; throws FlowViewError on invalid ones
    explicit FlowViewApp(AppConfig config);
    ~FlowViewApp();

    // Loads the files, then captures live until stopped. Returns the
    // process exit code.
    int run();

    // Async-signal-safe
    void stop();

    View& view() { return m_view; }

   private:
    bool loadFiles();
    bool runLive();

    AppConfig m_config;
    View m_view;
    ViewCommands m_commands;
    IngestionQueue m_queue;
    std::unique_ptr<CaptureEngine> m_capture;
    std::atomic<bool> m_stop_flag{false};
};

#endif  // FLOW_VIEW_APP_HPP
