#ifndef VIEW_OPTIONS_HPP
#define VIEW_OPTIONS_HPP

#include <optional>
#include <string>

// Options a View reacts to. Only the fields that are set are applied by
// View::configure(), so a caller can change one option at a time.
struct ViewOptions
{
    // Filter expression, empty for "show everything"
    std::optional<std::string> view_filter;
    // Name of the order key (time, method, url, size)
    std::optional<std::string> order;
    std::optional<bool> order_reversed;
    // Move focus to each newly shown flow
    std::optional<bool> focus_follow;
    std::optional<bool> show_marked_only;
};

#endif  // VIEW_OPTIONS_HPP
