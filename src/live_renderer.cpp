#include "live_renderer.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "logger.h"
#include "perf.h"

namespace rls {

RenderSession::RenderSession(Terminal& terminal,
                             std::shared_ptr<const SortKey> key,
                             const EntryRenderer& renderer,
                             LayoutOptions layout,
                             RenderOptions options)
    : terminal_(terminal),
      key_(std::move(key)),
      renderer_(renderer),
      layout_(layout),
      options_(std::move(options)),
      uncaught_on_entry_(std::uncaught_exceptions()) {
    if (!options_.clock) {
        options_.clock = [] { return RenderOptions::Clock::now(); };
    }
}

RenderSession::~RenderSession() {
    if (closed_) {
        return;
    }
    if (std::uncaught_exceptions() > uncaught_on_entry_) {
        Logger::instance().debug("session unwound by an exception; keeping the last live paint");
        return;
    }
    try {
        Close();
    } catch (const std::exception& ex) {
        Logger::instance().error("final paint failed: ", ex.what());
    }
}

std::size_t RenderSession::InsertionPoint(const Entry& entry) const {
    // First position whose item does not sort before `entry`.
    std::size_t left = 0;
    std::size_t right = items_.size();
    while (left < right) {
        const std::size_t mid = left + (right - left) / 2;
        if (key_->Less(items_[mid].entry, entry)) {
            left = mid + 1;
        } else {
            right = mid;
        }
    }
    return left;
}

void RenderSession::Insert(Entry entry) {
    std::string text = renderer_.Render(entry);
    const std::size_t at = InsertionPoint(entry);
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(at),
                  RenderedItem{std::move(entry), std::move(text)});
    perf::Manager::Instance().IncrementCounter("entries_inserted");

    if (options_.final_only) {
        return;
    }
    if (!DueForRepaint()) {
        perf::Manager::Instance().IncrementCounter("repaints_throttled");
        return;
    }
    Repaint();
}

bool RenderSession::DueForRepaint() {
    const auto now = options_.clock();
    if (last_repaint_ && now - *last_repaint_ < options_.min_interval) {
        Logger::instance().trace("repaint skipped after ", items_.size(), " items");
        return false;
    }
    last_repaint_ = now;
    return true;
}

std::vector<std::string> RenderSession::Lines() const {
    std::vector<std::string> cells;
    cells.reserve(items_.size());
    for (const RenderedItem& item : items_) {
        cells.push_back(item.text);
    }
    return layout_.Lines(cells);
}

void RenderSession::Repaint() {
    perf::Timer timer("session::repaint");
    perf::Manager::Instance().IncrementCounter("repaints");

    const std::vector<std::string> lines = Lines();
    terminal_.MoveCursorUp(painted_lines_);

    // One row stays free for the cursor below the listing.
    const int space = terminal_.Rows() - 1;
    painted_lines_ = 0;
    if (space <= 0) {
        return;
    }
    const std::size_t shown = std::min(lines.size(), static_cast<std::size_t>(space));
    for (std::size_t i = lines.size() - shown; i < lines.size(); ++i) {
        terminal_.ClearCurrentLine();
        terminal_.Write(lines[i]);
        terminal_.Write("\n");
        ++painted_lines_;
    }
    terminal_.Flush();
    Logger::instance().trace("repainted ", painted_lines_, " of ", lines.size(), " lines");
}

void RenderSession::Close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    const std::vector<std::string> lines = Lines();
    terminal_.MoveCursorUp(painted_lines_);
    for (const std::string& line : lines) {
        terminal_.ClearCurrentLine();
        terminal_.Write(line);
        terminal_.Write("\n");
    }
    terminal_.Flush();
    painted_lines_ = static_cast<int>(lines.size());
}

LiveRenderer::LiveRenderer(Terminal& terminal, RenderOptions options)
    : terminal_(terminal),
      options_(std::move(options)) {}

RenderSession LiveRenderer::BeginSession(std::shared_ptr<const SortKey> key,
                                         const EntryRenderer& renderer,
                                         LayoutOptions layout) const {
    return RenderSession(terminal_, std::move(key), renderer, layout, options_);
}

}  // namespace rls
