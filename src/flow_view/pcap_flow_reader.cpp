#include "pcap_flow_reader.hpp"

#include <stdexcept>
#include <unordered_map>

#include "capture_engine.hpp"
#include "http_flow_builder.hpp"
#include "logger.hpp"

PcapFlowReader::PcapFlowReader(std::string bpf_filter) : m_bpf_filter(std::move(bpf_filter)) {}

std::vector<FlowPtr> PcapFlowReader::read(const std::string& path)
{
    CaptureEngine engine(path, CaptureSource::File);
    if (!m_bpf_filter.empty() && !engine.addFilter(m_bpf_filter))
    {
        throw std::runtime_error("invalid capture filter: " + m_bpf_filter);
    }

    std::vector<FlowPtr> flows;
    std::unordered_map<std::string, size_t> positions;

    // Every event carries the latest state of its flow, keep the last one
    HttpFlowBuilder builder([&flows, &positions](const FlowEvent& event) {
        auto it = positions.find(event.flow->id());
        if (it == positions.end())
        {
            positions.emplace(event.flow->id(), flows.size());
            flows.push_back(event.flow);
        }
        else
        {
            flows[it->second] = event.flow;
        }
    });
    builder.setServerPort(engine.getFilterPort());

    engine.run(builder);
    builder.finish();

    LOG_DEBUG("read " << flows.size() << " flows from " << path);
    return flows;
}
