#pragma once

#include <optional>

#include <termios.h>

#include "termtris/controller/InputAction.hpp"

namespace termtris::console {

// Puts a terminal stdin into non-canonical, no-echo mode with VMIN = 0 for
// as long as it lives and restores the previous settings on destruction.
// File descriptor flags are never changed: stdout shares them on a tty.
class Terminal {
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // False when stdin is not a terminal (piped input); keys are still read,
    // polled so an idle pipe never blocks
    bool isRaw() const noexcept { return m_raw; }

    // Next pending key, if any. Never blocks.
    std::optional<char> pollKey();

    // Back to the original line mode (for prompts); enterRaw() undoes it
    void restore();
    void enterRaw();

    static void clearScreen();

private:
    bool inputPending();

    termios m_saved{};
    bool m_haveSaved{false};
    bool m_raw{false};
};

// Maps keys to InputAction; Ctrl-C (0x03) quits
termtris::controller::InputAction mapKey(char key) noexcept;

} // namespace termtris::console
