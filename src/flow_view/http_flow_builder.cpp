#include "http_flow_builder.hpp"

#include <picohttpparser.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string>

#include "logger.hpp"

constexpr size_t MAX_HEADERS = 100;
// Offsets this far "ahead" are a 32-bit sequence wrap, i.e. data from before
// the current response
constexpr uint32_t MAX_FORWARD_OFFSET = 4000000000U;
// Segments starting further than this past the received body are dropped
constexpr uint64_t MAX_BODY_GAP = 1024 * 1024;
// Largest response body kept per flow
constexpr uint64_t MAX_BODY_SIZE = 64 * 1024 * 1024;

namespace
{

bool iequals(const char* a, size_t a_len, const char* b)
{
    size_t b_len = std::strlen(b);
    if (a_len != b_len)
    {
        return false;
    }
    for (size_t i = 0; i < a_len; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
        {
            return false;
        }
    }
    return true;
}

std::optional<uint64_t> parse_content_length(const char* value, size_t len)
{
    uint64_t out = 0;
    auto result = std::from_chars(value, value + len, out);
    if (result.ec != std::errc() || result.ptr != value + len)
    {
        return std::nullopt;
    }
    return out;
}

bool looks_like_request(const uint8_t* payload, size_t len)
{
    const char* cbuf = reinterpret_cast<const char*>(payload);
    if (len == 0 || !std::isupper(static_cast<unsigned char>(cbuf[0])))
    {
        return false;
    }
    const char* method = nullptr;
    size_t method_len = 0;
    const char* path = nullptr;
    size_t path_len = 0;
    int minor_version = -1;
    phr_header headers[MAX_HEADERS];
    size_t num_headers = MAX_HEADERS;
    int ret = phr_parse_request(cbuf, len, &method, &method_len, &path, &path_len,
                                &minor_version, headers, &num_headers, 0);
    return ret != -1;
}

// Host header without the port part
std::string strip_port(const std::string& host)
{
    if (!host.empty() && host[0] == '[')
    {
        size_t close = host.find(']');
        return close == std::string::npos ? host : host.substr(1, close - 1);
    }
    return host.substr(0, host.find(':'));
}

bool has_no_body(const std::string& method, int status)
{
    return method == "HEAD" || status == 204 || status == 304 || (status >= 100 && status < 200);
}

}  // namespace

HttpFlowBuilder::HttpFlowBuilder(EventSink sink) : m_sink(std::move(sink)) {}

void HttpFlowBuilder::onPacketReceived(const struct pcap_pkthdr* hdr, const u_char* bytes)
{
    PayloadInfo info;
    if (!get_payload_info(hdr, bytes, info))
    {
        return;
    }

    const uint8_t* payload = bytes + info.payload_offset;
    const size_t payload_len = info.payload_len;
    const uint64_t ts_ms = timestamp_ms(hdr);
    const ConnectionKey key = ConnectionKey::from(info);

    auto it = m_connections.find(key);
    if (it == m_connections.end())
    {
        // Skip handshakes, ACKs and anything that does not open with a request
        if (payload_len == 0)
        {
            return;
        }
        if (m_server_port != 0 && info.dstport != m_server_port)
        {
            LOG_DEBUG("ignoring segment for unknown connection " << to_string(key));
            return;
        }
        if (m_server_port == 0 && !looks_like_request(payload, payload_len))
        {
            LOG_DEBUG("ignoring non-request segment for unknown connection " << to_string(key));
            return;
        }
        Connection conn;
        conn.client = Endpoint{info.src, info.srcport};
        conn.server = Endpoint{info.dst, info.dstport};
        it = m_connections.emplace(key, std::move(conn)).first;
        LOG_DEBUG("new connection " << to_string(key));
    }

    Connection& conn = it->second;
    const bool from_client = info.srcport == conn.client.port && conn.client.address == info.src;

    if (payload_len > 0)
    {
        if (from_client)
        {
            analyzeRequestPacket(conn, ts_ms, info, payload, payload_len);
        }
        else
        {
            analyzeResponsePacket(conn, ts_ms, info, payload, payload_len);
        }
    }

    if (info.flags & TH_RST)
    {
        closeConnection(key, true);
    }
    else if ((info.flags & TH_FIN) && !from_client)
    {
        closeConnection(key, false);
    }
}

void HttpFlowBuilder::analyzeRequestPacket(Connection& conn, uint64_t timestamp_ms,
                                           const PayloadInfo& info, const uint8_t* payload,
                                           size_t payload_len)
{
    const char* cbuf = reinterpret_cast<const char*>(payload);
    size_t offset = 0;

    // Rest of the previous request's body
    if (conn.request_body_remaining > 0 && !conn.pending.empty())
    {
        PendingFlow& last = conn.pending.back();
        size_t take = static_cast<size_t>(
            std::min<uint64_t>(conn.request_body_remaining, payload_len));
        last.flow->request.raw_content->append(cbuf, take);
        conn.request_body_remaining -= take;
        offset += take;
        if (conn.request_body_remaining == 0 && !last.announced)
        {
            last.announced = true;
            emit(FlowEventKind::Request, last.flow);
        }
    }

    // Several requests may share one segment (HTTP pipelining)
    int request_count = 0;
    while (offset < payload_len)
    {
        const char* method = nullptr;
        size_t method_len = 0;
        const char* path = nullptr;
        size_t path_len = 0;
        int minor_version = -1;
        phr_header headers[MAX_HEADERS];
        size_t num_headers = MAX_HEADERS;

        int ret = phr_parse_request(cbuf + offset, payload_len - offset, &method, &method_len,
                                    &path, &path_len, &minor_version, headers, &num_headers, 0);
        if (ret == -2)
        {
            LOG_DEBUG("HTTP request incomplete (need more bytes)");
            break;
        }
        if (ret < 0)
        {
            LOG_WARNING("HTTP request parse error from " << info.src << ":" << info.srcport);
            break;
        }
        request_count++;

        auto flow = std::make_shared<Flow>();
        flow->client = conn.client;
        flow->server = conn.server;

        HttpRequest& req = flow->request;
        req.method.assign(method, method_len);
        req.path.assign(path, path_len);
        req.http_version = "HTTP/1." + std::to_string(minor_version);
        req.host = conn.server.address;
        req.port = conn.server.port;
        req.timestamp_start_ms = timestamp_ms;

        uint64_t content_length = 0;
        for (size_t i = 0; i < num_headers; ++i)
        {
            if (headers[i].name == nullptr)
            {
                continue;  // folded continuation line
            }
            req.headers.emplace_back(std::string(headers[i].name, headers[i].name_len),
                                     std::string(headers[i].value, headers[i].value_len));
            if (iequals(headers[i].name, headers[i].name_len, "Host"))
            {
                req.host = strip_port(req.headers.back().second);
            }
            else if (iequals(headers[i].name, headers[i].name_len, "Content-Length"))
            {
                content_length =
                    parse_content_length(headers[i].value, headers[i].value_len).value_or(0);
            }
        }
        offset += static_cast<size_t>(ret);

        size_t take = static_cast<size_t>(std::min<uint64_t>(content_length, payload_len - offset));
        if (content_length > 0)
        {
            req.raw_content = std::string(cbuf + offset, take);
            offset += take;
        }
        conn.request_body_remaining = content_length - take;

        LOG_INFO("HTTP Request: " << req.method << " " << req.url());
        conn.pending.push_back(PendingFlow{flow, false});
        if (conn.request_body_remaining == 0)
        {
            conn.pending.back().announced = true;
            emit(FlowEventKind::Request, flow);
        }
    }

    if (request_count > 1)
    {
        LOG_DEBUG("pipelining: " << request_count << " requests in one segment");
    }
}

void HttpFlowBuilder::analyzeResponsePacket(Connection& conn, uint64_t timestamp_ms,
                                            const PayloadInfo& info, const uint8_t* payload,
                                            size_t payload_len)
{
    const char* cbuf = reinterpret_cast<const char*>(payload);
    const bool starts_header = payload_len >= 5 && std::memcmp(cbuf, "HTTP/", 5) == 0;

    if (!starts_header)
    {
        if (conn.response.header_seen)
        {
            appendBody(conn, info.seq, payload, payload_len);
            conn.pending.front().flow->response->timestamp_end_ms = timestamp_ms;
            if (conn.response.content_length &&
                conn.response.received >= *conn.response.content_length)
            {
                completeResponse(conn);
            }
        }
        else if (!conn.pending.empty())
        {
            // Reordered: body before header
            conn.buffered.push_back(
                BufferedPacket{info.seq, std::vector<uint8_t>(payload, payload + payload_len)});
            LOG_DEBUG("buffering pre-header segment seq=" << info.seq << " payload_len="
                      << payload_len << " (total buffered: " << conn.buffered.size() << ")");
        }
        else
        {
            LOG_DEBUG("ignoring server segment without pending request seq=" << info.seq);
        }
        return;
    }

    // A new header while the previous response is still open
    if (conn.response.header_seen)
    {
        if (conn.response.content_length &&
            conn.response.received < *conn.response.content_length)
        {
            LOG_WARNING("previous response incomplete: Content-Length="
                        << *conn.response.content_length
                        << " received=" << conn.response.received);
        }
        completeResponse(conn);
    }

    if (conn.pending.empty())
    {
        LOG_DEBUG("response without captured request from " << info.src << ":" << info.srcport);
        return;
    }

    int minor_version = -1;
    int status = 0;
    const char* msg = nullptr;
    size_t msg_len = 0;
    phr_header headers[MAX_HEADERS];
    size_t num_headers = MAX_HEADERS;
    int ret = phr_parse_response(cbuf, payload_len, &minor_version, &status, &msg, &msg_len,
                                 headers, &num_headers, 0);
    if (ret == -2)
    {
        LOG_DEBUG("HTTP response incomplete (need more bytes)");
        return;
    }
    if (ret < 0)
    {
        LOG_WARNING("HTTP response parse error from " << info.src << ":" << info.srcport);
        return;
    }
    if (status >= 100 && status < 200 && status != 101)
    {
        LOG_DEBUG("skipping interim response " << status);
        return;
    }

    PendingFlow& front = conn.pending.front();
    HttpResponse resp;
    resp.status_code = status;
    if (msg != nullptr)
    {
        resp.reason.assign(msg, msg_len);
    }
    resp.http_version = "HTTP/1." + std::to_string(minor_version);
    resp.timestamp_end_ms = timestamp_ms;
    resp.raw_content = std::string();

    std::optional<uint64_t> content_length;
    for (size_t i = 0; i < num_headers; ++i)
    {
        if (headers[i].name == nullptr)
        {
            continue;
        }
        resp.headers.emplace_back(std::string(headers[i].name, headers[i].name_len),
                                  std::string(headers[i].value, headers[i].value_len));
        if (iequals(headers[i].name, headers[i].name_len, "Content-Length"))
        {
            content_length = parse_content_length(headers[i].value, headers[i].value_len);
        }
    }
    if (has_no_body(front.flow->request.method, status))
    {
        content_length = 0;
    }
    front.flow->response = std::move(resp);

    conn.response = ResponseState{};
    conn.response.header_seen = true;
    conn.response.body_seq = info.seq + static_cast<uint32_t>(ret);
    conn.response.content_length = content_length;

    LOG_INFO("HTTP Response: " << status << " for " << front.flow->request.method << " "
             << front.flow->request.url());

    if (!front.announced)
    {
        front.announced = true;
        emit(FlowEventKind::Request, front.flow);
    }
    emit(FlowEventKind::Response, front.flow);

    // Segments that overtook the header
    if (!conn.buffered.empty())
    {
        LOG_DEBUG("processing " << conn.buffered.size() << " buffered segments");
        std::vector<BufferedPacket> buffered;
        buffered.swap(conn.buffered);
        for (const auto& packet : buffered)
        {
            appendBody(conn, packet.seq, packet.payload.data(), packet.payload.size());
        }
    }

    appendBody(conn, info.seq + static_cast<uint32_t>(ret), payload + ret,
               payload_len - static_cast<size_t>(ret));

    if (conn.response.content_length && conn.response.received >= *conn.response.content_length)
    {
        completeResponse(conn);
    }
}

void HttpFlowBuilder::appendBody(Connection& conn, uint32_t seq, const uint8_t* data, size_t len)
{
    if (conn.pending.empty() || len == 0)
    {
        return;
    }
    ResponseState& state = conn.response;

    uint32_t delta = seq - state.body_seq;
    if (delta > MAX_FORWARD_OFFSET)
    {
        LOG_DEBUG("segment seq=" << seq << " precedes the response body, ignored");
        return;
    }

    uint64_t start = delta;
    if (start > state.received + MAX_BODY_GAP)
    {
        LOG_WARNING("segment seq=" << seq << " starts " << (start - state.received)
                    << " bytes past the received body, ignored");
        return;
    }
    uint64_t end = start + len;
    if (end > MAX_BODY_SIZE)
    {
        if (!state.oversize_reported)
        {
            LOG_WARNING("body exceeds " << MAX_BODY_SIZE << " bytes, truncated");
            state.oversize_reported = true;
        }
        end = MAX_BODY_SIZE;
    }
    if (state.content_length && end > *state.content_length)
    {
        if (!state.excess_reported)
        {
            LOG_WARNING("body exceeds Content-Length(" << *state.content_length << ") by "
                        << (end - *state.content_length) << " bytes, truncated");
            state.excess_reported = true;
        }
        end = *state.content_length;
    }
    if (start >= end)
    {
        return;
    }

    std::string& body = *conn.pending.front().flow->response->raw_content;
    if (body.size() < end)
    {
        body.resize(static_cast<size_t>(end));
    }
    body.replace(static_cast<size_t>(start), static_cast<size_t>(end - start),
                 reinterpret_cast<const char*>(data), static_cast<size_t>(end - start));
    state.received = std::max(state.received, end);
}

void HttpFlowBuilder::completeResponse(Connection& conn)
{
    if (conn.pending.empty() || !conn.response.header_seen)
    {
        return;
    }
    FlowPtr flow = conn.pending.front().flow;
    conn.pending.pop_front();

    LOG_INFO("Flow complete: " << flow->request.method << " " << flow->request.url()
             << " body=" << conn.response.received << " bytes");
    emit(FlowEventKind::Response, flow);

    conn.response = ResponseState{};
    conn.buffered.clear();
}

void HttpFlowBuilder::closeConnection(const ConnectionKey& key, bool reset)
{
    auto it = m_connections.find(key);
    if (it == m_connections.end())
    {
        return;
    }
    Connection& conn = it->second;

    if (conn.response.header_seen)
    {
        const bool truncated = conn.response.content_length &&
                               conn.response.received < *conn.response.content_length;
        if (reset && truncated)
        {
            FlowPtr flow = conn.pending.front().flow;
            conn.pending.pop_front();
            flow->error = "connection reset";
            emit(FlowEventKind::Error, flow);
        }
        else
        {
            // Close-delimited body
            completeResponse(conn);
        }
    }

    if (reset)
    {
        for (auto& pending : conn.pending)
        {
            if (pending.announced)
            {
                pending.flow->error = "connection reset";
                emit(FlowEventKind::Error, pending.flow);
            }
        }
    }

    LOG_DEBUG((reset ? "reset " : "closed ") << to_string(key) << " with "
              << conn.pending.size() << " unanswered requests");
    m_connections.erase(it);
}

void HttpFlowBuilder::finish()
{
    for (auto& [key, conn] : m_connections)
    {
        if (conn.response.header_seen)
        {
            completeResponse(conn);
        }
    }
    m_connections.clear();
}

void HttpFlowBuilder::emit(FlowEventKind kind, const FlowPtr& flow)
{
    if (m_sink)
    {
        m_sink(FlowEvent{kind, std::make_shared<Flow>(*flow)});
    }
}
