#include "flow.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>

#include "flow_errors.hpp"
#include "logger.hpp"

namespace
{

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

uint16_t default_port(const std::string& scheme)
{
    return scheme == "https" ? 443 : 80;
}

uint16_t parse_port(const std::string& text, const std::string& url)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; }))
    {
        throw FlowViewError("Invalid URL: " + url);
    }
    unsigned long port = 0;
    try
    {
        port = std::stoul(text);
    }
    catch (const std::out_of_range&)
    {
        throw FlowViewError("Invalid URL: " + url);
    }
    if (port == 0 || port > 65535)
    {
        throw FlowViewError("Invalid URL: " + url);
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

std::string HttpRequest::url() const
{
    std::string out = scheme + "://" + host;
    if (port != default_port(scheme))
    {
        out += ":" + std::to_string(port);
    }
    if (path.empty() || path[0] != '/')
    {
        out += "/";
    }
    out += path;
    return out;
}

std::optional<std::string> HttpRequest::header(const std::string& name) const
{
    const std::string wanted = to_lower(name);
    for (const auto& [hdr_name, hdr_value] : headers)
    {
        if (to_lower(hdr_name) == wanted)
        {
            return hdr_value;
        }
    }
    return std::nullopt;
}

std::string make_flow_id()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    // version 4, variant 10xx
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xffff),
                  static_cast<unsigned>(hi & 0xffff), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return std::string(buf);
}

Flow::Flow() : m_id(make_flow_id()) {}

Flow::Flow(std::string id) : m_id(std::move(id)) {}

void Flow::setKillHook(KillHook hook)
{
    m_kill_hook = std::move(hook);
    m_killable = true;
}

void Flow::kill()
{
    if (!m_killable)
    {
        return;
    }
    if (m_kill_hook)
    {
        m_kill_hook();
    }
    m_kill_hook = nullptr;
    m_killable = false;
    error = "killed";
    LOG_DEBUG("flow " << m_id << " killed");
}

FlowPtr Flow::copy() const
{
    auto dup = std::make_shared<Flow>();
    dup->client = client;
    dup->server = server;
    dup->request = request;
    dup->response = response;
    dup->error = error;
    dup->marked = marked;
    return dup;
}

FlowPtr Flow::make(const std::string& method, const std::string& url)
{
    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
    {
        throw FlowViewError("Invalid URL: " + url);
    }

    HttpRequest req;
    req.method = to_upper(method);
    req.scheme = to_lower(url.substr(0, scheme_end));
    if (req.scheme != "http" && req.scheme != "https")
    {
        throw FlowViewError("Invalid URL: " + url);
    }

    const std::string rest = url.substr(scheme_end + 3);
    const size_t path_start = rest.find('/');
    const std::string authority = rest.substr(0, path_start);
    req.path = path_start == std::string::npos ? "/" : rest.substr(path_start);

    req.port = default_port(req.scheme);
    if (!authority.empty() && authority[0] == '[')
    {
        // [v6addr]:port
        const size_t close = authority.find(']');
        if (close == std::string::npos)
        {
            throw FlowViewError("Invalid URL: " + url);
        }
        req.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':')
            {
                throw FlowViewError("Invalid URL: " + url);
            }
            req.port = parse_port(authority.substr(close + 2), url);
        }
    }
    else
    {
        const size_t colon = authority.rfind(':');
        req.host = authority.substr(0, colon);
        if (colon != std::string::npos)
        {
            req.port = parse_port(authority.substr(colon + 1), url);
        }
    }
    if (req.host.empty())
    {
        throw FlowViewError("Invalid URL: " + url);
    }
    req.headers.emplace_back("Host", req.host);

    auto flow = std::make_shared<Flow>();
    flow->client = Endpoint{"", 0};
    flow->server = Endpoint{req.host, req.port};
    flow->request = std::move(req);
    return flow;
}
