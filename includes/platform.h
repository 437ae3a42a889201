#pragma once

#include <optional>

namespace rls {

class Platform {
public:
    static bool enableVirtualTerminal();
    static bool isOutputTerminal();
    static int terminalHeight();

    // 1-based row of the cursor within the visible screen, asked of the
    // terminal itself. Empty when there is no terminal or it did not answer.
    static std::optional<int> cursorRow();

    // Ctrl-C prints "Interrupted." and exits with status 130.
    static void installInterruptHandler();
};

}  // namespace rls
