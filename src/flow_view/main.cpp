#include <cstring>
#include <iostream>
#include <string>

#include "flow_errors.hpp"
#include "flow_view_app.hpp"
#include "logger.hpp"

static void usage(const char* prog)
{
    std::cerr << "Usage: " << prog
              << " (-r <file.pcap>... | -i <interface>) [-f <filter>] [view options] [-v <level>] "
                 "[--quiet] [--timestamp]\n";
    std::cerr << "  -r <file.pcap>         Load HTTP flows from a capture file (repeatable)\n";
    std::cerr << "  -i <interface>         Capture HTTP flows live on an interface\n";
    std::cerr << "  -f <filter>            BPF filter, e.g. \"tcp port 8080\"\n";
    std::cerr << "  --view-filter <expr>   Only display flows matching expr (e.g. \"~m GET ~c 200\")\n";
    std::cerr << "  --order <name>         Sort by time, method, url or size (default: time)\n";
    std::cerr << "  --reverse              Reverse the display order\n";
    std::cerr << "  --marked-only          Only display marked flows\n";
    std::cerr << "  --focus-follow         Keep the focus on the newest flow\n";
    std::cerr << "  -v <level>             Log level: debug, info, warning, error or 0-4 (default: info)\n";
    std::cerr << "  --quiet                Disable all logging\n";
    std::cerr << "  --timestamp            Show timestamps in logs\n";
}

int main(int argc, char** argv)
{
    AppConfig config;
    LogLevel log_level = LogLevel::INFO;
    bool show_timestamp = false;

    if (argc == 1)
    {
        usage(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc)
        {
            config.files.emplace_back(argv[++i]);
        }
        else if (std::strcmp(argv[i], "-i") == 0 && i + 1 < argc)
        {
            config.interface = argv[++i];
        }
        else if (std::strcmp(argv[i], "-f") == 0 && i + 1 < argc)
        {
            config.bpf_filter = argv[++i];
        }
        else if (std::strcmp(argv[i], "--view-filter") == 0 && i + 1 < argc)
        {
            config.view_options.view_filter = argv[++i];
        }
        else if (std::strcmp(argv[i], "--order") == 0 && i + 1 < argc)
        {
            config.view_options.order = argv[++i];
        }
        else if (std::strcmp(argv[i], "--reverse") == 0)
        {
            config.view_options.order_reversed = true;
        }
        else if (std::strcmp(argv[i], "--marked-only") == 0)
        {
            config.view_options.show_marked_only = true;
        }
        else if (std::strcmp(argv[i], "--focus-follow") == 0)
        {
            config.view_options.focus_follow = true;
        }
        else if (std::strcmp(argv[i], "-v") == 0 && i + 1 < argc)
        {
            auto level = Logger::parseLevel(argv[++i]);
            if (!level)
            {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
            log_level = *level;
        }
        else if (std::strcmp(argv[i], "--quiet") == 0)
        {
            log_level = LogLevel::NONE;
        }
        else if (std::strcmp(argv[i], "--timestamp") == 0)
        {
            show_timestamp = true;
        }
        else
        {
            usage(argv[0]);
            return 1;
        }
    }

    if (config.files.empty() && config.interface.empty())
    {
        std::cerr << "Neither a capture file nor an interface specified.\n";
        usage(argv[0]);
        return 1;
    }

    Logger::setLevel(log_level);
    Logger::setShowTimestamp(show_timestamp);

    LOG_INFO("flowview starting...");
    for (const auto& file : config.files)
    {
        LOG_INFO("File: " << file);
    }
    if (!config.interface.empty())
    {
        LOG_INFO("Interface: " << config.interface);
    }
    if (!config.bpf_filter.empty())
    {
        LOG_INFO("Filter: " << config.bpf_filter);
    }
    LOG_DEBUG("Log level: " << Logger::levelToString(log_level));

    try
    {
        FlowViewApp app(std::move(config));
        int rc = app.run();
        LOG_INFO("flowview stopped");
        return rc;
    }
    catch (const FlowViewError& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
