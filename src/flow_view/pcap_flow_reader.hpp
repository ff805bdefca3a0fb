#ifndef PCAP_FLOW_READER_HPP
#define PCAP_FLOW_READER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "flow_reader.hpp"

// Reconstructs HTTP flows from a pcap savefile
class PcapFlowReader : public FlowReader
{
   public:
    // `bpf_filter` restricts the frames considered; a "port N" in it also
    // names the server side of every connection
    explicit PcapFlowReader(std::string bpf_filter = "");

    std::vector<FlowPtr> read(const std::string& path) override;
    const char* getFormatName() const override { return "pcap"; }

   private:
    std::string m_bpf_filter;
};

#endif  // PCAP_FLOW_READER_HPP
