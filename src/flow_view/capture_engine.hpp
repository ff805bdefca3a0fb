#ifndef CAPTURE_ENGINE_HPP
#define CAPTURE_ENGINE_HPP

#include <pcap.h>

#include <atomic>
#include <string>

#include "http_flow_builder.hpp"

enum class CaptureSource
{
    Interface,  // live capture on a network interface
    File        // offline read of a pcap savefile
};

class CaptureEngine
{
   public:
    CaptureEngine(const std::string& source, CaptureSource kind = CaptureSource::Interface);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    bool addFilter(const std::string& filter);
    void stop();

    // Get the server port extracted from the filter (0 if not found)
    uint16_t getFilterPort() const { return m_filter_port; }

    CaptureSource kind() const { return m_kind; }

    // Feeds every captured frame to `builder` until the source is exhausted,
    // stop() is called or `stop_flag` becomes true
    void run(HttpFlowBuilder& builder, std::atomic<bool>* stop_flag = nullptr);

    // Extract port from BPF filter string
    static uint16_t extractPortFromFilter(const std::string& filter);

   private:
    void openLive(const std::string& interface);
    void openOffline(const std::string& path);

    pcap_t* m_handle{nullptr};
    CaptureSource m_kind;
    uint16_t m_filter_port{0};
};

#endif  // CAPTURE_ENGINE_HPP
