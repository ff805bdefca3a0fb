#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "flow.hpp"
#include "flow_view.hpp"
#include "logger.hpp"

// Flow with a request started at `start_ms` and, when `body` is non-zero, a
// 200 response carrying `body` bytes
inline FlowPtr make_test_flow(const std::string& method, uint64_t start_ms, size_t body = 0,
                              bool marked = false)
{
    auto flow = std::make_shared<Flow>();
    flow->request.method = method;
    flow->request.host = "example.com";
    flow->request.path = "/" + std::to_string(start_ms);
    flow->request.timestamp_start_ms = start_ms;
    if (body > 0)
    {
        HttpResponse response;
        response.status_code = 200;
        response.raw_content = std::string(body, 'x');
        flow->response = response;
    }
    flow->marked = marked;
    return flow;
}

inline std::vector<std::string> ids_of(const std::vector<FlowPtr>& flows)
{
    std::vector<std::string> out;
    for (const auto& flow : flows)
    {
        out.push_back(flow->id());
    }
    return out;
}

// Records every view signal as "kind:id" (or just "kind")
class SignalRecorder
{
   public:
    explicit SignalRecorder(View& view) : m_signals(view.signals())
    {
        m_add = m_signals.viewAdd.connect([this](const FlowPtr& f) { events.push_back("add:" + f->id()); });
        m_remove = m_signals.viewRemove.connect(
            [this](const FlowPtr& f) { events.push_back("remove:" + f->id()); });
        m_update = m_signals.viewUpdate.connect(
            [this](const FlowPtr& f) { events.push_back("update:" + f->id()); });
        m_refresh = m_signals.viewRefresh.connect([this]() { events.push_back("refresh"); });
        m_store_remove = m_signals.storeRemove.connect(
            [this](const FlowPtr& f) { events.push_back("store_remove:" + f->id()); });
        m_store_refresh =
            m_signals.storeRefresh.connect([this]() { events.push_back("store_refresh"); });
    }

    ~SignalRecorder()
    {
        m_signals.viewAdd.disconnect(m_add);
        m_signals.viewRemove.disconnect(m_remove);
        m_signals.viewUpdate.disconnect(m_update);
        m_signals.viewRefresh.disconnect(m_refresh);
        m_signals.storeRemove.disconnect(m_store_remove);
        m_signals.storeRefresh.disconnect(m_store_refresh);
    }

    size_t count(const std::string& prefix) const
    {
        size_t n = 0;
        for (const auto& e : events)
        {
            if (e.compare(0, prefix.size(), prefix) == 0)
            {
                n++;
            }
        }
        return n;
    }

    std::vector<std::string> events;

   private:
    ViewSignals& m_signals;
    size_t m_add, m_remove, m_update, m_refresh, m_store_remove, m_store_refresh;
};

// Captures log records for the lifetime of the object
class LogCapture
{
   public:
    explicit LogCapture(LogLevel level) : m_previous(Logger::getLevel())
    {
        Logger::setLevel(level);
        Logger::setOutput(&out, &err);
    }

    ~LogCapture()
    {
        Logger::setOutput(nullptr, nullptr);
        Logger::setLevel(m_previous);
    }

    std::string all() const { return out.str() + err.str(); }

    std::ostringstream out;
    std::ostringstream err;

   private:
    LogLevel m_previous;
};

#endif  // TEST_SUPPORT_HPP
