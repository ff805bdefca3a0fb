#ifndef SIGNAL_HPP
#define SIGNAL_HPP

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "flow.hpp"

// Synchronous in-process signal. Handlers run on the emitting thread, in the
// order they were connected, after the emitter has finished its own state
// update. A handler must not call back into the mutating operation that
// emitted the signal.
template <typename... Args>
class Signal
{
   public:
    using Handler = std::function<void(Args...)>;
    using Connection = size_t;

    Connection connect(Handler handler)
    {
        Connection id = ++m_last_id;
        m_handlers.emplace_back(id, std::move(handler));
        return id;
    }

    bool disconnect(Connection id)
    {
        for (auto it = m_handlers.begin(); it != m_handlers.end(); ++it)
        {
            if (it->first == id)
            {
                m_handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(Args... args) const
    {
        // Copy so that a handler may disconnect itself
        auto handlers = m_handlers;
        for (const auto& entry : handlers)
        {
            entry.second(args...);
        }
    }

    size_t size() const { return m_handlers.size(); }

   private:
    std::vector<std::pair<Connection, Handler>> m_handlers;
    Connection m_last_id{0};
};

// Notifications published by a View.
//
// The view* signals describe changes of the displayed set: updating a flow
// that is in the store but not shown triggers nothing. If a flow is removed
// from the store while shown, viewRemove fires first, then storeRemove.
struct ViewSignals
{
    Signal<const FlowPtr&> viewAdd;
    Signal<const FlowPtr&> viewRemove;
    Signal<const FlowPtr&> viewUpdate;
    // The displayed sequence must be re-read completely
    Signal<> viewRefresh;

    Signal<const FlowPtr&> storeRemove;
    // Store membership changed in bulk
    Signal<> storeRefresh;
};

#endif  // SIGNAL_HPP
