#ifndef FLOW_READER_HPP
#define FLOW_READER_HPP

#include <string>
#include <vector>

#include "flow.hpp"

// Abstract interface for reading flows from a persisted source
class FlowReader
{
   public:
    virtual ~FlowReader() = default;

    // Reads every flow found at `path`, in the order they were recorded.
    // Throws std::runtime_error if the source cannot be opened.
    virtual std::vector<FlowPtr> read(const std::string& path) = 0;

    // Get the format name (e.g., "pcap")
    virtual const char* getFormatName() const = 0;
};

#endif  // FLOW_READER_HPP
