#include "termtris/console/Terminal.hpp"

#include <cstdio>
#include <iostream>

#include <poll.h>
#include <unistd.h>

namespace termtris::console {

using termtris::controller::InputAction;

Terminal::Terminal()
{
    if (::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &m_saved) == 0) {
        m_haveSaved = true;
    }
    enterRaw();
}

Terminal::~Terminal()
{
    restore();
}

void Terminal::enterRaw()
{
    if (m_haveSaved) {
        termios raw = m_saved;
        // No ISIG: Ctrl-C arrives as a key so the destructor still runs
        raw.c_lflag &= ~(ICANON | ECHO | ISIG);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0) {
            m_raw = true;
        } else {
            std::cerr << "Terminal: failed to enter raw mode\n";
        }
    }
    // Hide cursor while the board is drawn
    std::cout << "\x1b[?25l" << std::flush;
}

void Terminal::restore()
{
    if (m_raw) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        m_raw = false;
    }
    std::cout << "\x1b[?25h" << std::flush;
}

bool Terminal::inputPending()
{
    if (m_raw) {
        // VMIN = 0 already makes read() return at once
        return true;
    }
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN) != 0;
}

std::optional<char> Terminal::pollKey()
{
    if (!inputPending()) {
        return std::nullopt;
    }

    char c = 0;
    if (::read(STDIN_FILENO, &c, 1) != 1) {
        return std::nullopt;
    }

    // Arrow keys arrive as ESC [ A..D
    if (c == '\x1b') {
        char seq[2] = {0, 0};
        if (!inputPending() || ::read(STDIN_FILENO, &seq[0], 1) != 1 || seq[0] != '[') {
            return c;
        }
        if (!inputPending() || ::read(STDIN_FILENO, &seq[1], 1) != 1) {
            return c;
        }
        switch (seq[1]) {
        case 'A': return 'w';
        case 'B': return 's';
        case 'C': return 'd';
        case 'D': return 'a';
        default:  return std::nullopt;
        }
    }
    return c;
}

void Terminal::clearScreen()
{
    // Home the cursor and wipe the screen
    std::cout << "\x1b[H\x1b[2J";
}

InputAction mapKey(char key) noexcept
{
    switch (key) {
        case 'a': case 'A': return InputAction::MoveLeft;
        case 'd': case 'D': return InputAction::MoveRight;
        case 's': case 'S': return InputAction::SoftDrop;
        case 'w': case 'W': return InputAction::RotateCW;
        case 'z': case 'Z': return InputAction::RotateCCW;
        case ' ':           return InputAction::HardDrop;
        case 'p': case 'P': return InputAction::PauseResume;
        case 'q': case 'Q': return InputAction::Quit;
        case '\x03':        return InputAction::Quit; // Ctrl-C
        default:            return InputAction::None;
    }
}

} // namespace termtris::console
