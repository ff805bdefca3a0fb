#ifndef FLOW_HPP
#define FLOW_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class Flow;
using FlowPtr = std::shared_ptr<Flow>;

using HttpHeader = std::pair<std::string, std::string>;

struct Endpoint
{
    std::string address;
    uint16_t port{0};
};

struct HttpRequest
{
    std::string method;                    // GET, POST, etc.
    std::string scheme{"http"};
    std::string host;                      // Host header value, or server address
    uint16_t port{80};
    std::string path{"/"};                 // /path/to/resource?query
    std::string http_version{"HTTP/1.1"};
    std::vector<HttpHeader> headers;
    uint64_t timestamp_start_ms{0};        // 0 when unknown
    std::optional<std::string> raw_content;

    // scheme://host[:port]/path, the port only when it is not the scheme default
    std::string url() const;

    // Value of the first header named `name` (case-insensitive)
    std::optional<std::string> header(const std::string& name) const;
};

struct HttpResponse
{
    int status_code{0};
    std::string reason;
    std::string http_version{"HTTP/1.1"};
    std::vector<HttpHeader> headers;
    uint64_t timestamp_end_ms{0};
    std::optional<std::string> raw_content;
};

// One observed HTTP exchange. The id is assigned at construction and never
// changes; two Flow objects are the same record iff their ids are equal.
class Flow
{
   public:
    using KillHook = std::function<void()>;

    Flow();
    explicit Flow(std::string id);

    const std::string& id() const { return m_id; }

    bool killable() const { return m_killable; }

    // Installs the producer's kill capability and makes the flow killable
    void setKillHook(KillHook hook);

    // Invokes the kill hook (if any) and records the flow as killed
    void kill();

    // Deep copy bearing a fresh id. The copy is not killable.
    FlowPtr copy() const;

    // Synthetic flow for `method url` with dummy client/server endpoints
    static FlowPtr make(const std::string& method, const std::string& url);

    Endpoint client;
    Endpoint server;
    HttpRequest request;
    std::optional<HttpResponse> response;
    std::optional<std::string> error;
    bool marked{false};

   private:
    std::string m_id;
    bool m_killable{false};
    KillHook m_kill_hook;
};

// Random (version 4) UUID in canonical textual form
std::string make_flow_id();

inline bool same_flow(const FlowPtr& a, const FlowPtr& b)
{
    return a && b && a->id() == b->id();
}

#endif  // FLOW_HPP
