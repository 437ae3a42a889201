#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "column_layout.h"
#include "entry.h"
#include "entry_renderer.h"
#include "sort_key.h"
#include "terminal.h"

namespace rls {

struct RenderOptions {
    using Clock = std::chrono::steady_clock;

    // Paint only once, when the session closes.
    bool final_only = false;
    // Inserts closer together than this do not repaint.
    std::chrono::milliseconds min_interval{100};
    // Steady clock unless replaced.
    std::function<Clock::time_point()> clock;
};

struct RenderedItem {
    Entry entry;
    std::string text;
};

// Keeps a sorted listing on screen while entries arrive.
//
// Every insert places the entry at its sorted position and, throttled by
// RenderOptions::min_interval, repaints the whole listing over the previous
// paint. Leaving the scope normally (or calling Close) paints the complete
// listing once more. When the scope is left by an exception the last live
// paint is left on screen as is.
class RenderSession {
public:
    RenderSession(Terminal& terminal,
                  std::shared_ptr<const SortKey> key,
                  const EntryRenderer& renderer,
                  LayoutOptions layout = {},
                  RenderOptions options = {});
    ~RenderSession();

    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    void Insert(Entry entry);

    // Final paint of the complete listing. Later calls do nothing.
    void Close();

    const std::vector<RenderedItem>& items() const { return items_; }
    // Current lines of the full layout.
    std::vector<std::string> Lines() const;
    // Lines written by the latest paint.
    int painted_lines() const { return painted_lines_; }
    bool closed() const { return closed_; }

private:
    std::size_t InsertionPoint(const Entry& entry) const;
    bool DueForRepaint();
    void Repaint();

    Terminal& terminal_;
    std::shared_ptr<const SortKey> key_;
    const EntryRenderer& renderer_;
    ColumnLayout layout_;
    RenderOptions options_;

    std::vector<RenderedItem> items_;
    int painted_lines_ = 0;
    std::optional<RenderOptions::Clock::time_point> last_repaint_;
    int uncaught_on_entry_ = 0;
    bool closed_ = false;
};

// Opens sessions on one terminal with shared options.
class LiveRenderer {
public:
    explicit LiveRenderer(Terminal& terminal, RenderOptions options = {});

    RenderSession BeginSession(std::shared_ptr<const SortKey> key,
                               const EntryRenderer& renderer,
                               LayoutOptions layout = {}) const;

private:
    Terminal& terminal_;
    RenderOptions options_;
};

}  // namespace rls
