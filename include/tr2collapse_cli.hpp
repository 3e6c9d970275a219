#pragma once

#include <charconv>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "tr2collapse.hpp"

namespace tr2collapse {

struct CliOptions {
    CollapseConfig config;
    bool show_help = false;
    bool show_man = false;
};

namespace detail {
inline int parse_debug_level(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw ConfigException("Invalid value for --debug: '" + std::string(text) + "'");
    }
    return value;
}

// 支持 "--name=value", "--name value" 和短选项 "-x value"
inline bool take_value(const std::vector<std::string>& args, size_t& i, std::string_view long_name,
                       std::string_view short_name, std::string& value) {
    std::string_view arg = args[i];
    std::string prefix = std::string(long_name) + "=";

    if (arg.compare(0, prefix.size(), prefix) == 0) {
        value = std::string(arg.substr(prefix.size()));
        return true;
    }
    if (arg == long_name || (! short_name.empty() && arg == short_name)) {
        if (i + 1 >= args.size()) {
            throw ConfigException("Option " + std::string(arg) + " requires a value");
        }
        value = args[++i];
        return true;
    }
    return false;
}
} // namespace detail

/**
 * @brief 解析命令行 (不含程序名)
 *
 * 非选项参数都作为输入文件, "-" 表示 stdin, "--" 之后的参数一律当作文件.
 */
inline CliOptions parse_command_line(const std::vector<std::string>& args) {
    CliOptions options;
    bool only_files = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (only_files || arg == "-" || arg.empty() || arg[0] != '-') {
            options.config.inputs.push_back(arg);
        } else if (arg == "--") {
            only_files = true;
        } else if (arg == "-h" || arg == "--help" || arg == "-?") {
            options.show_help = true;
        } else if (arg == "--man") {
            options.show_man = true;
        } else if (arg == "--dump-raw") {
            options.config.dump_raw = true;
        } else if (detail::take_value(args, i, "--debug", "-d", value)) {
            options.config.debug_level = detail::parse_debug_level(value);
        } else if (detail::take_value(args, i, "--separator", "-s", value)) {
            options.config.frame_separator = value;
        } else {
            throw ConfigException("Unknown option: " + arg);
        }
    }

    options.config.validate();
    return options;
}

inline CliOptions parse_command_line(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}

inline void print_usage(std::ostream& os, std::string_view program) {
    os << "Usage: " << program << " [--debug=N] [--dump-raw] [--separator=S] [--help] [--man] [FILE...]\n";
}

inline void print_manual(std::ostream& os, std::string_view program) {
    print_usage(os, program);
    os << "\n"
          "Collapse git trace2 event streams (GIT_TRACE2_EVENT) into one line per stack path,\n"
          "with the accumulated duration of every command and region on that path.\n"
          "Input is read from the given files in order, or from standard input.\n"
          "\n"
          "Options:\n"
          "  -d, --debug=N       diagnostics on stderr: 1 reports dropped data,\n"
          "                      2 echoes unrecognized events, 3 echoes every event\n"
          "      --dump-raw      print the normalized records as JSON instead of folding them;\n"
          "                      the format is not stable\n"
          "  -s, --separator=S   frame separator in the output paths (default '/');\n"
          "                      use ';' for flamegraph.pl\n"
          "  -h, --help          short usage\n"
          "      --man           this text\n"
          "\n"
          "Durations are 100000 * (end - start) in seconds, truncated; they are not samples.\n"
          "\n"
          "Examples:\n"
          "  GIT_TRACE2_EVENT=/tmp/git.events git status\n"
          "  " << program << " /tmp/git.events > out.folded\n"
          "  " << program << " --separator=';' /tmp/git.events | flamegraph.pl --countname microseconds > git.svg\n";
}

} // namespace tr2collapse
