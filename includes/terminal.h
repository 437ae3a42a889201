#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace rls {

// Cursor and line primitives the live renderer paints through.
class Terminal {
public:
    virtual ~Terminal() = default;

    // Moves the cursor up by at most `lines` rows; returns how far it moved,
    // which is less than asked when the cursor reaches the top of the screen.
    virtual int MoveCursorUp(int lines) = 0;
    virtual void ClearCurrentLine() = 0;
    // 1-based row of the cursor, when the terminal can tell.
    virtual std::optional<int> CursorRow() = 0;
    // Height of the visible screen in rows.
    virtual int Rows() = 0;
    virtual void Write(std::string_view text) = 0;
    virtual void Flush() = 0;
};

// Terminal over an output stream using ANSI control sequences. When the stream
// is not interactive (a pipe or a file) cursor movement and line clearing are
// dropped and the screen is treated as unbounded.
class AnsiTerminal : public Terminal {
public:
    AnsiTerminal(std::ostream& out, bool interactive);

    int MoveCursorUp(int lines) override;
    void ClearCurrentLine() override;
    std::optional<int> CursorRow() override;
    int Rows() override;
    void Write(std::string_view text) override;
    void Flush() override;

    [[nodiscard]] bool interactive() const { return interactive_; }

private:
    std::ostream& out_;
    bool interactive_;
};

}  // namespace rls
