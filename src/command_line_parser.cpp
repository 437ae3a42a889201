#include "command_line_parser.h"

#include <cctype>
#include <cstdlib>
#include <deque>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include <CLI/CLI.hpp>

#include "version.h"

namespace rls {

namespace {

using Detail = Config::Detail;

class ConfigBuilder {
public:
    std::string& path() { return path_; }

    void SetFilter(Config::Filter filter)
    {
        actions_.emplace_back([filter](Config& cfg) { cfg.set_filter(filter); });
    }

    void SetCreationTime(Detail detail)
    {
        actions_.emplace_back([detail](Config& cfg) { cfg.set_creation_time(detail); });
    }

    void SetModificationTime(Detail detail)
    {
        actions_.emplace_back([detail](Config& cfg) { cfg.set_modification_time(detail); });
    }

    void SetSubCounts(Detail detail)
    {
        actions_.emplace_back([detail](Config& cfg) { cfg.set_sub_counts(detail); });
    }

    void SetSize(Detail detail)
    {
        actions_.emplace_back([detail](Config& cfg) { cfg.set_size(detail); });
    }

    void SetHighlightExtensions(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_highlight_extensions(value); });
    }

    void SetColumns(std::size_t columns)
    {
        actions_.emplace_back([columns](Config& cfg) { cfg.set_columns(columns); });
    }

    void SetWidth(std::size_t width)
    {
        actions_.emplace_back([width](Config& cfg) { cfg.set_width(width); });
    }

    void SetNoColour(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_no_colour(value); });
    }

    void SetNoRunning(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_no_running(value); });
    }

    void SetRowWise(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_row_wise(value); });
    }

    void SetUniformWidth(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_uniform_width(value); });
    }

    void SetLogLevel(Logger::Level level)
    {
        actions_.emplace_back([level](Config& cfg) { cfg.set_log_level(level); });
    }

    void SetPerfLogging(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_perf_logging(value); });
    }

    Config Build() const
    {
        Config cfg;
        cfg.set_path(path_.empty() ? std::string(".") : path_);
        for (const auto& action : actions_) {
            action(cfg);
        }
        return cfg;
    }

private:
    std::string path_ = ".";
    std::vector<std::function<void(Config&)>> actions_;
};

// One occurrence of -x/--sort or -X/--reverse-sort. Without a key, the key
// is inferred from the included attributes.
struct SortRequest {
    bool reverse = false;
    std::optional<std::string> key;
};

bool IsSortFlag(std::string_view arg, bool& reverse)
{
    if (arg == "-x" || arg == "--sort") {
        reverse = false;
        return true;
    }
    if (arg == "-X" || arg == "--reverse-sort") {
        reverse = true;
        return true;
    }
    return false;
}

// A cluster of short flags containing -x or -X, such as "-sx" or "-xnf".
struct SortCluster {
    std::string before;
    bool reverse = false;
    std::string after;
};

// Flags ahead of the sort letter must take no value; -w does, so "-w5x" is
// left to CLI11.
std::optional<SortCluster> SplitSortCluster(std::string_view arg)
{
    if (arg.size() < 3 || arg[0] != '-' || arg[1] == '-') {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < arg.size(); ++i) {
        const char ch = arg[i];
        if (ch == 'x' || ch == 'X') {
            return SortCluster{std::string(arg.substr(1, i - 1)), ch == 'X', std::string(arg.substr(i + 1))};
        }
        if (ch == 'w' || std::isalnum(static_cast<unsigned char>(ch)) == 0) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

}  // namespace

const std::map<std::string, SortField>& CommandLineParser::SortKeyMap() {
    static const std::map<std::string, SortField> map{
        {"n", SortField::Name},
        {"c", SortField::CreationTime},
        {"m", SortField::ModificationTime},
        {"nf", SortField::SubfileCount},
        {"nd", SortField::SubdirCount},
        {"s", SortField::Size},
        {"e", SortField::Extension},
    };
    return map;
}

Config CommandLineParser::Parse(int argc, char** argv) const {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i] != nullptr ? argv[i] : "");
    }
    return Run(args, true);
}

Config CommandLineParser::ParseArguments(const std::vector<std::string>& args) const {
    return Run(args, false);
}

Config CommandLineParser::Run(const std::vector<std::string>& args, bool exit_on_error) const {
    ConfigBuilder builder;

    CLI::App program{R"(List directory contents, sorted, while they are being read.
Displayed attributes are always in the order: creation time, last modification
time, number of sub-files, number of sub-directories, size, path (each only
present if requested).)", "rls"};
    program.set_version_flag("--version", Version::FullString());

    program.add_option("path", builder.path(), "which directory's contents to list (defaults to here)")
        ->type_name("PATH");

    auto filtering = program.add_option_group("Filtering options");
    auto files_option = filtering->add_flag_callback("-f,--files",
        [&]() { builder.SetFilter(Config::Filter::FilesOnly); }, "only list files");
    auto dirs_option = filtering->add_flag_callback("-d,--directories",
        [&]() { builder.SetFilter(Config::Filter::DirectoriesOnly); }, "only list directories");
    files_option->excludes(dirs_option);

    auto attributes = program.add_option_group("Attribute options");
    auto add_detail_pair = [&](const std::string& short_names, const std::string& long_names,
                               std::function<void(Detail)> setter,
                               const std::string& description) {
        auto short_option = attributes->add_flag_callback(short_names,
            [setter]() { setter(Detail::Short); }, description);
        auto long_option = attributes->add_flag_callback(long_names,
            [setter]() { setter(Detail::Long); }, "'" + short_names.substr(0, 2) + "' in long format");
        short_option->excludes(long_option);
    };
    add_detail_pair("-c,--ctime", "-C,--long-ctime",
        [&](Detail d) { builder.SetCreationTime(d); }, "include creation time");
    add_detail_pair("-m,--mtime", "-M,--long-mtime",
        [&](Detail d) { builder.SetModificationTime(d); }, "include last modification time");
    add_detail_pair("-n,--sub-counts", "-N,--long-sub-counts",
        [&](Detail d) { builder.SetSubCounts(d); },
        "include number of sub-files/sub-directories for directories");
    add_detail_pair("-s,--size", "-S,--long-size",
        [&](Detail d) { builder.SetSize(d); }, "include size");
    attributes->add_flag_callback("-e,--extensions", [&]() { builder.SetHighlightExtensions(true); },
        "highlight extensions");

    auto sorting = program.add_option_group("Sorting options");
    auto sort_option = sorting->add_flag("-x,--sort",
        R"(sort in ascending order by KEY, inferred from the single
included attribute when omitted: n - name, c - creation time,
m - last modification time, nf - number of sub-files,
nd - number of sub-directories, s - size, e - extensions)");
    sort_option->option_text("[KEY]");
    auto reverse_sort_option = sorting->add_flag("-X,--reverse-sort", "'-x' in descending order");
    reverse_sort_option->option_text("[KEY]");
    sort_option->excludes(reverse_sort_option);

    auto layout = program.add_option_group("Layout options");
    auto single_option = layout->add_flag_callback("-1,--single-column",
        [&]() { builder.SetColumns(1); }, "display as a single column");
    auto columns_option = layout->add_option_function<int>("--columns",
        [&](const int& columns) {
            if (columns < 1) {
                throw CLI::ValidationError("--columns", "COUNT must be at least 1");
            }
            builder.SetColumns(static_cast<std::size_t>(columns));
        },
        "display with at most this many columns");
    columns_option->type_name("COUNT");
    single_option->excludes(columns_option);

    auto width_option = layout->add_option_function<int>("-w,--width",
        [&](const int& width) {
            if (width < 1) {
                throw CLI::ValidationError("--width", "COLS must be at least 1");
            }
            builder.SetWidth(static_cast<std::size_t>(width));
        },
        "total width available to the columns");
    width_option->type_name("COLS");
    width_option->default_str(std::to_string(Config::kDefaultWidth));

    layout->add_flag_callback("--row-wise", [&]() { builder.SetRowWise(true); },
        "display sorted row-wise instead of column-wise");
    layout->add_flag_callback("--uniform-width", [&]() { builder.SetUniformWidth(true); },
        "display with equal-width columns");

    auto appearance = program.add_option_group("Appearance options");
    appearance->add_flag_callback("--no-colour,--no-color", [&]() { builder.SetNoColour(true); },
        "display without colour");
    appearance->add_flag_callback("--no-running", [&]() { builder.SetNoRunning(true); },
        "display only once finished");

    auto debug = program.add_option_group("Debug options");
    auto level_option = debug->add_option_function<std::string>("--log-level",
        [&](const std::string& value) {
            auto level = Logger::ParseLevel(value);
            if (!level) {
                throw CLI::ValidationError("--log-level", "unknown LEVEL '" + value + "'");
            }
            builder.SetLogLevel(*level);
        },
        "diagnostics written to stderr: error, warn, info, debug, trace (default: error)");
    level_option->type_name("LEVEL");
    debug->add_flag_callback("--perf-debug", [&]() { builder.SetPerfLogging(true); },
        "enable performance diagnostics");

    // -x and -X take an optional KEY, which CLI11 flags cannot. The keys are
    // taken out here and the flags passed on bare. A following argument is
    // consumed only when it is a valid key, so a bare flag can precede PATH.
    // Inside a cluster, the letters after the sort flag are its KEY when they
    // form one and further flags otherwise.
    const auto& key_map = SortKeyMap();
    std::vector<SortRequest> sort_requests;
    std::vector<std::string> arg_storage;
    arg_storage.reserve(args.size());

    std::deque<std::string> pending(args.begin(), args.end());
    auto take_following_key = [&](SortRequest& request) {
        if (!pending.empty() && key_map.count(pending.front()) > 0) {
            request.key = std::move(pending.front());
            pending.pop_front();
        }
    };

    while (!pending.empty()) {
        std::string current = std::move(pending.front());
        pending.pop_front();
        if (current == "--") {
            arg_storage.push_back(std::move(current));
            arg_storage.insert(arg_storage.end(), pending.begin(), pending.end());
            break;
        }

        bool reverse = false;
        if (IsSortFlag(current, reverse)) {
            SortRequest request{reverse, std::nullopt};
            take_following_key(request);
            sort_requests.push_back(std::move(request));
            arg_storage.push_back(std::move(current));
            continue;
        }
        const std::size_t equals = current.find('=');
        if (equals != std::string::npos && IsSortFlag(std::string_view(current).substr(0, equals), reverse)) {
            sort_requests.push_back(SortRequest{reverse, current.substr(equals + 1)});
            arg_storage.push_back(current.substr(0, equals));
            continue;
        }
        if (auto cluster = SplitSortCluster(current)) {
            if (!cluster->before.empty()) {
                arg_storage.push_back("-" + cluster->before);
            }
            SortRequest request{cluster->reverse, std::nullopt};
            if (key_map.count(cluster->after) > 0) {
                request.key = cluster->after;
            } else if (!cluster->after.empty()) {
                pending.push_front("-" + cluster->after);
            } else {
                take_following_key(request);
            }
            sort_requests.push_back(std::move(request));
            arg_storage.emplace_back(cluster->reverse ? "-X" : "-x");
            continue;
        }

        arg_storage.push_back(std::move(current));
    }

    // CLI11 consumes its argument list back to front.
    std::vector<std::string> reversed(arg_storage.rbegin(), arg_storage.rend());

    try {
        program.parse(reversed);

        Config config = builder.Build();

        if (!sort_requests.empty()) {
            const SortRequest& request = sort_requests.back();
            const char* option = request.reverse ? "-X/--reverse-sort" : "-x/--sort";
            SortField field = SortField::Name;
            if (request.key) {
                auto it = key_map.find(*request.key);
                if (it == key_map.end()) {
                    throw CLI::ValidationError(option, "invalid KEY '" + *request.key + "'");
                }
                field = it->second;
            } else if (auto inferred = config.InferSortField()) {
                field = *inferred;
            } else {
                throw CLI::ValidationError(option, "cannot infer sort key: too many included attributes");
            }
            config.set_sort_field(field);
            config.set_reverse(request.reverse);
        }
        return config;
    } catch (const CLI::ParseError& e) {
        if (!exit_on_error) {
            throw;
        }
        std::exit(program.exit(e));
    }
}

}  // namespace rls
