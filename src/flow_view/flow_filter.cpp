#include "flow_filter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "logger.hpp"

namespace
{

bool iequals(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::optional<int> parse_status(const std::string& text)
{
    if (text.empty() || text.size() > 3 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
    {
        return std::nullopt;
    }
    return std::stoi(text);
}

// Atoms that take one argument
bool takes_argument(const std::string& atom)
{
    return atom == "~m" || atom == "~u" || atom == "~d" || atom == "~c";
}

std::optional<FlowFilter> make_atom(const std::string& atom, const std::string& arg)
{
    if (atom == "." || atom == "~a")
    {
        return match_all();
    }
    if (atom == "~marked")
    {
        return FlowFilter([](const Flow& f) { return f.marked; });
    }
    if (atom == "~s")
    {
        return FlowFilter([](const Flow& f) { return f.response.has_value(); });
    }
    if (atom == "~q")
    {
        return FlowFilter([](const Flow& f) { return !f.response.has_value(); });
    }
    if (atom == "~e")
    {
        return FlowFilter([](const Flow& f) { return f.error.has_value(); });
    }
    if (atom == "~m")
    {
        return FlowFilter([arg](const Flow& f) { return iequals(f.request.method, arg); });
    }
    if (atom == "~u")
    {
        return FlowFilter(
            [arg](const Flow& f) { return f.request.url().find(arg) != std::string::npos; });
    }
    if (atom == "~d")
    {
        return FlowFilter(
            [arg](const Flow& f) { return f.request.host.find(arg) != std::string::npos; });
    }
    if (atom == "~c")
    {
        std::optional<int> code = parse_status(arg);
        if (!code)
        {
            return std::nullopt;
        }
        int wanted = *code;
        return FlowFilter([wanted](const Flow& f) {
            return f.response.has_value() && f.response->status_code == wanted;
        });
    }
    return std::nullopt;
}

}  // namespace

FlowFilter match_all()
{
    return [](const Flow&) { return true; };
}

std::optional<FlowFilter> SimpleFilterParser::parse(const std::string& text) const
{
    std::istringstream in(text);
    std::vector<std::string> tokens;
    for (std::string tok; in >> tok;)
    {
        tokens.push_back(tok);
    }
    if (tokens.empty())
    {
        return std::nullopt;
    }

    std::vector<std::vector<FlowFilter>> alternatives(1);
    bool negate = false;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        std::string tok = tokens[i];
        if (tok == "|")
        {
            if (negate || alternatives.back().empty())
            {
                return std::nullopt;
            }
            alternatives.emplace_back();
            continue;
        }
        if (tok == "!")
        {
            negate = !negate;
            continue;
        }
        if (tok.size() > 1 && tok[0] == '!')
        {
            negate = !negate;
            tok.erase(0, 1);
        }

        std::string arg;
        if (takes_argument(tok))
        {
            if (i + 1 >= tokens.size())
            {
                LOG_DEBUG("filter: '" << tok << "' expects an argument");
                return std::nullopt;
            }
            arg = tokens[++i];
        }

        std::optional<FlowFilter> atom = make_atom(tok, arg);
        if (!atom)
        {
            LOG_DEBUG("filter: unknown term '" << tok << "'");
            return std::nullopt;
        }
        if (negate)
        {
            FlowFilter inner = std::move(*atom);
            atom = FlowFilter([inner](const Flow& f) { return !inner(f); });
            negate = false;
        }
        alternatives.back().push_back(std::move(*atom));
    }
    if (negate || alternatives.back().empty())
    {
        return std::nullopt;
    }

    return FlowFilter([alternatives](const Flow& f) {
        for (const auto& conj : alternatives)
        {
            bool ok = std::all_of(conj.begin(), conj.end(),
                                  [&f](const FlowFilter& term) { return term(f); });
            if (ok)
            {
                return true;
            }
        }
        return false;
    });
}
