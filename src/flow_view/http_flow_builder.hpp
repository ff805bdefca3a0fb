#ifndef HTTP_FLOW_BUILDER_HPP
#define HTTP_FLOW_BUILDER_HPP

#include <pcap.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "flow.hpp"
#include "flow_event.hpp"
#include "packet_utils.hpp"

// Reassembles HTTP/1.x exchanges from captured TCP segments into Flows.
//
// A Request event is produced once a request (including its body) has been
// seen, a Response event when the response header arrives and again when the
// body is complete, an Error event when the connection is reset under an
// unanswered request. Every event carries a snapshot of the flow.
class HttpFlowBuilder
{
   public:
    using EventSink = std::function<void(const FlowEvent&)>;

    explicit HttpFlowBuilder(EventSink sink);
    virtual ~HttpFlowBuilder() = default;

    // Port that identifies the server side. With 0 the side that sends the
    // first parseable request is taken to be the client.
    void setServerPort(uint16_t port) { m_server_port = port; }

    // Main entry point: receives one captured frame
    virtual void onPacketReceived(const struct pcap_pkthdr* h, const u_char* bytes);

    // Completes responses still in progress (end of capture)
    void finish();

    size_t connectionCount() const { return m_connections.size(); }

   private:
    // Server segment that arrived before the response header
    struct BufferedPacket
    {
        uint32_t seq;
        std::vector<uint8_t> payload;
    };

    struct PendingFlow
    {
        FlowPtr flow;
        bool announced{false};
    };

    struct ResponseState
    {
        bool header_seen{false};
        uint32_t body_seq{0};                   // sequence number of the first body byte
        std::optional<uint64_t> content_length;
        uint64_t received{0};                   // furthest body offset seen
        bool excess_reported{false};
        bool oversize_reported{false};
    };

    struct Connection
    {
        Endpoint client;
        Endpoint server;
        std::deque<PendingFlow> pending;        // requests awaiting a response, oldest first
        uint64_t request_body_remaining{0};
        ResponseState response;
        std::vector<BufferedPacket> buffered;
    };

    // Analyzes HTTP request packets (client → server)
    void analyzeRequestPacket(Connection& conn, uint64_t timestamp_ms, const PayloadInfo& info,
                              const uint8_t* payload, size_t payload_len);

    // Analyzes HTTP response packets (server → client)
    void analyzeResponsePacket(Connection& conn, uint64_t timestamp_ms, const PayloadInfo& info,
                               const uint8_t* payload, size_t payload_len);

    void appendBody(Connection& conn, uint32_t seq, const uint8_t* data, size_t len);
    void completeResponse(Connection& conn);
    void closeConnection(const ConnectionKey& key, bool reset);
    void emit(FlowEventKind kind, const FlowPtr& flow);

    std::map<ConnectionKey, Connection> m_connections;
    EventSink m_sink;
    uint16_t m_server_port{0};
};

#endif  // HTTP_FLOW_BUILDER_HPP
