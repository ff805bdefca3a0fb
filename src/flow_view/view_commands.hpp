#ifndef VIEW_COMMANDS_HPP
#define VIEW_COMMANDS_HPP

#include <functional>
#include <string>
#include <vector>

#include "flow.hpp"
#include "flow_reader.hpp"
#include "flow_view.hpp"

// Command surface over a View, as bound to key presses or a command line.
class ViewCommands
{
   public:
    // Receives the flows whose settings a command changed, once per command
    using UpdateHandler = std::function<void(const std::vector<FlowPtr>&)>;

    explicit ViewCommands(View& view, UpdateHandler on_update = nullptr);

    // Move the focus one displayed position; no-op at either end
    void focusNext();
    void focusPrev();

    std::vector<std::string> orderOptions() const;

    // Toggle whether only marked flows are shown
    void toggleMarked();

    std::string getValue(const FlowPtr& flow, const std::string& key,
                         const std::string& default_value) const;
    void setValue(const std::vector<FlowPtr>& flows, const std::string& key,
                  const std::string& value);

    // Flips `key` between "true" and "false"; a missing key counts as "false"
    void setValueToggle(const std::vector<FlowPtr>& flows, const std::string& key);

    // Adds a fresh-id copy of every flow the reader yields. Returns the count.
    size_t load(FlowReader& reader, const std::string& path);

    // Focus the flow at `offset`; negative counts from the end, out-of-range
    // offsets are clamped. No-op on an empty view.
    void go(long long offset);

    // Adds copies of `flows` and focuses the first copy
    void duplicate(const std::vector<FlowPtr>& flows);

    void remove(const std::vector<FlowPtr>& flows);

    std::vector<FlowPtr> resolve(const std::string& selector) const;

    // Adds a synthetic flow for `method url` and returns it
    FlowPtr create(const std::string& method, const std::string& url);

   private:
    void notifyUpdated(const std::vector<FlowPtr>& flows);

    View& m_view;
    UpdateHandler m_on_update;
};

#endif  // VIEW_COMMANDS_HPP
