#include "flow_view_app.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>

#include "http_flow_builder.hpp"
#include "logger.hpp"
#include "pcap_flow_reader.hpp"
#include "signal_registry.hpp"
#include "view_summary.hpp"

constexpr std::chrono::milliseconds QUEUE_POLL_INTERVAL{200};

FlowViewApp::FlowViewApp(AppConfig config) : m_config(std::move(config)), m_commands(m_view)
{
    m_view.configure(m_config.view_options);
}

FlowViewApp::~FlowViewApp() = default;

int FlowViewApp::run()
{
    if (!loadFiles())
    {
        return 1;
    }
    if (!m_config.interface.empty() && !runLive())
    {
        return 1;
    }

    ViewSummary::printSummary(m_view);
    return 0;
}

bool FlowViewApp::loadFiles()
{
    PcapFlowReader reader(m_config.bpf_filter);
    for (const auto& path : m_config.files)
    {
        try
        {
            m_commands.load(reader, path);
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Cannot load " << path << ": " << e.what());
            return false;
        }
    }
    return true;
}

bool FlowViewApp::runLive()
{
    try
    {
        m_capture = std::make_unique<CaptureEngine>(m_config.interface);
    }
    catch (const std::runtime_error& e)
    {
        LOG_ERROR(e.what());
        return false;
    }
    if (!m_config.bpf_filter.empty() && !m_capture->addFilter(m_config.bpf_filter))
    {
        return false;
    }

    uint16_t server_port = m_capture->getFilterPort();
    if (server_port != 0)
    {
        LOG_INFO("Server port extracted from filter: " << server_port);
    }

    HttpFlowBuilder builder([this](const FlowEvent& event) { m_queue.push(event); });
    builder.setServerPort(server_port);

    SignalRegistry<FlowViewApp>::registerInstance(this);

    // The capture thread only produces events; the view is touched here
    std::thread capture_thread([this, &builder] {
        try
        {
            m_capture->run(builder, &m_stop_flag);
            builder.finish();
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Capture stopped: " << e.what());
        }
        m_queue.close();
    });

    while (!m_queue.closed() || m_queue.size() > 0)
    {
        m_queue.waitFor(QUEUE_POLL_INTERVAL);
        size_t applied = m_queue.apply(m_view);
        if (applied > 0)
        {
            LOG_DEBUG("applied " << applied << " capture events, " << m_view.size()
                      << " flows displayed");
        }
    }
    capture_thread.join();
    m_queue.apply(m_view);

    SignalRegistry<FlowViewApp>::unregisterInstance();
    return true;
}

void FlowViewApp::stop()
{
    m_stop_flag.store(true, std::memory_order_release);
    if (m_capture)
    {
        m_capture->stop();
    }
}
