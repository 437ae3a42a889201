#pragma once

#include <ostream>

#include "column_layout.h"
#include "command_line_parser.h"
#include "config.h"
#include "entry_renderer.h"
#include "live_renderer.h"
#include "terminal.h"
#include "time_formatter.h"

namespace rls {

class App {
public:
    int run(int argc, char** argv);

    // Lists config.path() through a live session on `terminal`. Errors go to
    // `err`; returns the exit status.
    static int List(const Config& config, Terminal& terminal, const RenderOptions& render_options,
                    std::ostream& err);

    // Row renderer for the attributes the config includes, in their fixed
    // display order.
    static EntryRenderer BuildRenderer(const Config& config, const TimeFormatter::Options& time_options);
    static LayoutOptions BuildLayout(const Config& config);

    static constexpr int kSeriousError = 2;

private:
    CommandLineParser parser_{};
};

}  // namespace rls
