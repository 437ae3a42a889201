#include "app.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

#include "entry.h"
#include "logger.h"
#include "perf.h"
#include "platform.h"
#include "sort_key.h"

namespace fs = std::filesystem;

namespace rls {

namespace {

bool Culled(const Config& config, const Entry& entry) {
    switch (config.filter()) {
        case Config::Filter::FilesOnly:
            return entry.is_directory();
        case Config::Filter::DirectoriesOnly:
            return !entry.is_directory();
        case Config::Filter::All:
        default:
            return false;
    }
}

}  // namespace

int App::run(int argc, char** argv) {
    const bool virtual_terminal_enabled = Platform::enableVirtualTerminal();

    Config config = parser_.Parse(argc, argv);
    Logger::instance().set_level(config.log_level());

    perf::Manager& perf_manager = perf::Manager::Instance();
    perf_manager.set_enabled(config.perf_logging());
    std::optional<perf::Timer> run_timer;
    if (perf_manager.enabled()) {
        run_timer.emplace("app::run");
    }
    if (!virtual_terminal_enabled) {
        config.set_no_colour(true);
    }

    Platform::installInterruptHandler();

    const bool interactive = Platform::isOutputTerminal();
    AnsiTerminal terminal(std::cout, interactive);
    RenderOptions render_options;
    render_options.final_only = config.no_running() || !interactive;
    Logger::instance().debug("listing ", config.path(), interactive ? " on a terminal" : " to a pipe",
                             render_options.final_only ? ", final paint only" : "");

    const int rc = List(config, terminal, render_options, std::cerr);

    if (perf_manager.enabled()) {
        run_timer.reset();
        perf_manager.Report(std::cerr);
    }
    return rc;
}

int App::List(const Config& config, Terminal& terminal, const RenderOptions& render_options,
              std::ostream& err) {
    const fs::path path(config.path());

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        Logger::instance().error("cannot open ", path.string(), ": ", ec.message());
        err << "rls: error: cannot open directory '" << path.string() << "': " << ec.message() << "\n";
        return kSeriousError;
    }

    TimeFormatter::Options time_options;
    time_options.now = std::chrono::system_clock::now();
    const EntryRenderer renderer = BuildRenderer(config, time_options);
    const auto key = keys::For(config.sort_field(), config.reverse());

    try {
        RenderSession session(terminal, key, renderer, BuildLayout(config), render_options);
        for (const fs::directory_entry& dir_entry : it) {
            Entry entry = Entry::FromDirectoryEntry(dir_entry);
            if (Culled(config, entry)) {
                continue;
            }
            session.Insert(std::move(entry));
        }
    } catch (const fs::filesystem_error& e) {
        err << "rls: error: " << e.what() << "\n";
        return kSeriousError;
    }
    return 0;
}

EntryRenderer App::BuildRenderer(const Config& config, const TimeFormatter::Options& time_options) {
    Palette palette;
    palette.enabled = !config.no_colour();

    auto time_formatter = [&time_options](Config::Detail detail) {
        TimeFormatter::Options options = time_options;
        options.long_form = detail == Config::Detail::Long;
        return TimeFormatter(options);
    };

    EntryRenderer renderer;
    if (config.creation_time() != Config::Detail::Hidden) {
        renderer.Add(std::make_unique<TimeColumn>(TimeColumn::Field::Creation,
                                                  time_formatter(config.creation_time()), palette));
    }
    if (config.modification_time() != Config::Detail::Hidden) {
        renderer.Add(std::make_unique<TimeColumn>(TimeColumn::Field::Modification,
                                                  time_formatter(config.modification_time()), palette));
    }
    if (config.sub_counts() != Config::Detail::Hidden) {
        const bool long_form = config.sub_counts() == Config::Detail::Long;
        renderer.Add(std::make_unique<CountColumn>(CountColumn::Field::Subfiles, long_form, palette));
        renderer.Add(std::make_unique<CountColumn>(CountColumn::Field::Subdirs, long_form, palette));
    }
    if (config.size() != Config::Detail::Hidden) {
        renderer.Add(std::make_unique<SizeColumn>(config.size() == Config::Detail::Long, palette));
    }
    renderer.Add(std::make_unique<NameColumn>(config.highlight_extensions(), palette));
    return renderer;
}

LayoutOptions App::BuildLayout(const Config& config) {
    LayoutOptions layout;
    layout.max_total_width = config.width();
    layout.max_columns = config.max_columns();
    layout.row_wise = config.row_wise();
    layout.uniform_width = config.uniform_width();
    return layout;
}

}  // namespace rls
