#include "terminal.h"

#include <algorithm>
#include <limits>
#include <string>

#include "platform.h"

namespace rls {

AnsiTerminal::AnsiTerminal(std::ostream& out, bool interactive)
    : out_(out),
      interactive_(interactive) {}

int AnsiTerminal::MoveCursorUp(int lines) {
    if (lines <= 0 || !interactive_) {
        return 0;
    }
    int moved = lines;
    if (auto row = CursorRow()) {
        moved = std::min(lines, *row - 1);
    }
    if (moved <= 0) {
        return 0;
    }
    out_ << "\x1b[" << moved << 'A';
    return moved;
}

void AnsiTerminal::ClearCurrentLine() {
    if (!interactive_) {
        return;
    }
    out_ << "\x1b[2K\r";
}

std::optional<int> AnsiTerminal::CursorRow() {
    if (!interactive_) {
        return std::nullopt;
    }
    // The reply describes the screen as drawn, so pending output goes first.
    out_.flush();
    return Platform::cursorRow();
}

int AnsiTerminal::Rows() {
    if (!interactive_) {
        return std::numeric_limits<int>::max();
    }
    return Platform::terminalHeight();
}

void AnsiTerminal::Write(std::string_view text) {
    out_ << text;
}

void AnsiTerminal::Flush() {
    out_.flush();
}

}  // namespace rls
