#include "capture_engine.hpp"

#include <cctype>
#include <stdexcept>

#include "logger.hpp"

constexpr auto PCAP_BUFFER_SIZE = 128 * 1024 * 1024;  // 128MB
constexpr auto PCAP_TIMEOUT = 1000;                   // 1 second
constexpr auto PCAP_SNAPLEN = 262144;

struct CallbackData
{
    HttpFlowBuilder* builder;
    std::atomic<bool>* stop_flag;
    pcap_t* handle;
};

extern "C" void pkt_handler(u_char* user, const struct pcap_pkthdr* hdr, const u_char* bytes)
{
    CallbackData* data = reinterpret_cast<CallbackData*>(user);

    if (data->stop_flag != nullptr && data->stop_flag->load(std::memory_order_acquire))
    {
        pcap_breakloop(data->handle);
        return;
    }

    data->builder->onPacketReceived(hdr, bytes);
}

CaptureEngine::CaptureEngine(const std::string& source, CaptureSource kind) : m_kind(kind)
{
    if (kind == CaptureSource::File)
    {
        openOffline(source);
    }
    else
    {
        openLive(source);
    }
}

CaptureEngine::~CaptureEngine()
{
    if (m_handle != nullptr)
    {
        pcap_close(m_handle);
    }
}

void CaptureEngine::openLive(const std::string& interface)
{
    char errbuf[PCAP_ERRBUF_SIZE];

    m_handle = pcap_create(interface.c_str(), errbuf);
    if (m_handle == nullptr)
    {
        throw std::runtime_error(std::string("pcap_create failed: ") + errbuf);
    }

    if (pcap_set_snaplen(m_handle, PCAP_SNAPLEN) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set snaplen");
    }

    if (pcap_set_promisc(m_handle, 1) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set promisc mode");
    }

    if (pcap_set_timeout(m_handle, PCAP_TIMEOUT) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set timeout");
    }

    // Buffer size only takes effect before activation
    if (pcap_set_buffer_size(m_handle, PCAP_BUFFER_SIZE) != 0)
    {
        pcap_close(m_handle);
        throw std::runtime_error("Failed to set buffer size");
    }

    int status = pcap_activate(m_handle);
    if (status != 0)
    {
        if (status > 0)
        {
            LOG_WARNING("pcap_activate warning: " << pcap_geterr(m_handle));
        }
        else
        {
            std::string error = std::string("pcap_activate failed: ") + pcap_geterr(m_handle);
            pcap_close(m_handle);
            throw std::runtime_error(error);
        }
    }

    LOG_INFO("Capture on " << interface << " initialized with 128MB buffer, snaplen="
             << PCAP_SNAPLEN);
}

void CaptureEngine::openOffline(const std::string& path)
{
    char errbuf[PCAP_ERRBUF_SIZE];

    m_handle = pcap_open_offline(path.c_str(), errbuf);
    if (m_handle == nullptr)
    {
        throw std::runtime_error(std::string("pcap_open_offline failed: ") + errbuf);
    }
    if (pcap_datalink(m_handle) != DLT_EN10MB)
    {
        const char* link_name = pcap_datalink_val_to_name(pcap_datalink(m_handle));
        std::string error = std::string("unsupported link type ") +
                            (link_name ? link_name : "unknown") + " in " + path;
        pcap_close(m_handle);
        m_handle = nullptr;
        throw std::runtime_error(error);
    }
    LOG_DEBUG("Opened capture file " << path);
}

uint16_t CaptureEngine::extractPortFromFilter(const std::string& filter)
{
    // Look for patterns like "port 8080" or "port 80"
    size_t port_pos = filter.find("port");
    if (port_pos == std::string::npos)
    {
        return 0;
    }

    size_t num_start = port_pos + 4;
    while (num_start < filter.length() && std::isspace(static_cast<unsigned char>(filter[num_start])))
    {
        ++num_start;
    }

    if (num_start >= filter.length() || !std::isdigit(static_cast<unsigned char>(filter[num_start])))
    {
        return 0;
    }

    unsigned long port = 0;
    for (size_t i = num_start; i < filter.length() && std::isdigit(static_cast<unsigned char>(filter[i])); ++i)
    {
        port = port * 10 + static_cast<unsigned long>(filter[i] - '0');
        if (port > 65535)
        {
            return 0;
        }
    }
    return static_cast<uint16_t>(port);
}

bool CaptureEngine::addFilter(const std::string& filter)
{
    if (m_handle == nullptr)
    {
        return false;
    }

    m_filter_port = extractPortFromFilter(filter);

    struct bpf_program bfp;
    if (pcap_compile(m_handle, &bfp, filter.c_str(), 0, PCAP_NETMASK_UNKNOWN) == -1)
    {
        LOG_ERROR("pcap_compile failed: " << pcap_geterr(m_handle));
        return false;
    }

    if (pcap_setfilter(m_handle, &bfp) == -1)
    {
        LOG_ERROR("pcap_setfilter failed: " << pcap_geterr(m_handle));
        pcap_freecode(&bfp);
        return false;
    }
    pcap_freecode(&bfp);
    return true;
}

void CaptureEngine::run(HttpFlowBuilder& builder, std::atomic<bool>* stop_flag)
{
    CallbackData data;
    data.builder = &builder;
    data.stop_flag = stop_flag;
    data.handle = m_handle;

    int result = pcap_loop(m_handle, -1, pkt_handler, reinterpret_cast<u_char*>(&data));

    if (result == PCAP_ERROR_BREAK)
    {
        LOG_INFO("Capture loop terminated by breakloop");
    }
    else if (result == PCAP_ERROR)
    {
        LOG_ERROR("Error in pcap_loop: " << pcap_geterr(m_handle));
    }

    // Savefiles have no kernel statistics
    if (m_kind == CaptureSource::File)
    {
        return;
    }

    struct pcap_stat stats;
    if (pcap_stats(m_handle, &stats) == 0)
    {
        LOG_INFO("=== PCAP STATISTICS ===");
        LOG_INFO("Packets received by filter: " << stats.ps_recv);
        LOG_INFO("Packets dropped by kernel: " << stats.ps_drop);
        LOG_INFO("Packets dropped by interface: " << stats.ps_ifdrop);
        if (stats.ps_drop > 0)
        {
            LOG_WARNING(stats.ps_drop << " packets were dropped, the view may miss flows");
        }
        LOG_INFO("=======================");
    }
}

void CaptureEngine::stop()
{
    if (m_handle != nullptr)
    {
        pcap_breakloop(m_handle);
    }
}
