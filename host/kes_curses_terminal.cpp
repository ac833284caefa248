#include "kes_curses_terminal.hpp"
#include "kes_error.hpp"

#include "spdlog/spdlog.h"

#include <curses.h>

#include <cstdio>
#include <vector>

namespace {

chtype toCursesAttrs(uint8_t attrs) {
    chtype result = A_NORMAL;
    if (attrs & kKestrelAttr_Bold)
        result |= A_BOLD;
    if (attrs & kKestrelAttr_Reverse)
        result |= A_REVERSE;
    if (attrs & kKestrelAttr_Underline)
        result |= A_UNDERLINE;
    if (attrs & kKestrelAttr_Dim)
        result |= A_DIM;
    return result;
}

KestrelInputEvent makeKeyEvent(KestrelKey key, unsigned modifiers = kKestrelModifier_None) {
    KestrelInputEvent event{};
    event.type = KestrelInputType::Key;
    event.key = key;
    event.modifiers = modifiers;
    return event;
}

KestrelInputEvent makeCharacterEvent(char ch, unsigned modifiers = kKestrelModifier_None) {
    auto event = makeKeyEvent(KestrelKey::Character, modifiers);
    event.character = ch;
    return event;
}

} // namespace

KestrelInputEvent kestrelTranslateCursesKey(int ch) {
    if (ch >= KEY_F(1) && ch <= KEY_F(12)) {
        return makeKeyEvent(
            static_cast<KestrelKey>(static_cast<int>(KestrelKey::F1) + (ch - KEY_F(1))));
    }
    switch (ch) {
    case '\n':
    case '\r':
    case KEY_ENTER:
        return makeKeyEvent(KestrelKey::Enter);
    case 27:
        return makeKeyEvent(KestrelKey::Escape);
    case 8:
    case 127:
    case KEY_BACKSPACE:
        return makeKeyEvent(KestrelKey::Backspace);
    case '\t':
        return makeKeyEvent(KestrelKey::Tab);
    case KEY_BTAB:
        return makeKeyEvent(KestrelKey::BackTab, kKestrelModifier_Shift);
    case KEY_UP:
        return makeKeyEvent(KestrelKey::Up);
    case KEY_DOWN:
        return makeKeyEvent(KestrelKey::Down);
    case KEY_LEFT:
        return makeKeyEvent(KestrelKey::Left);
    case KEY_RIGHT:
        return makeKeyEvent(KestrelKey::Right);
    case KEY_SLEFT:
        return makeKeyEvent(KestrelKey::Left, kKestrelModifier_Shift);
    case KEY_SRIGHT:
        return makeKeyEvent(KestrelKey::Right, kKestrelModifier_Shift);
    case KEY_HOME:
        return makeKeyEvent(KestrelKey::Home);
    case KEY_END:
        return makeKeyEvent(KestrelKey::End);
    case KEY_PPAGE:
        return makeKeyEvent(KestrelKey::PageUp);
    case KEY_NPAGE:
        return makeKeyEvent(KestrelKey::PageDown);
    case KEY_IC:
        return makeKeyEvent(KestrelKey::Insert);
    case KEY_DC:
        return makeKeyEvent(KestrelKey::Delete);
    default:
        break;
    }
    //  remaining control codes are Ctrl+letter
    if (ch >= 1 && ch <= 26) {
        return makeCharacterEvent(char('a' + ch - 1), kKestrelModifier_Ctrl);
    }
    if (ch >= 0x20 && ch < 0x7f) {
        return makeCharacterEvent(char(ch));
    }
    return KestrelInputEvent{};
}

KestrelCursesTerminal::KestrelCursesTerminal(bool showCursor, int escapeDelayMs)
    : showCursor_(showCursor), escapeDelayMs_(escapeDelayMs) {}

KestrelCursesTerminal::~KestrelCursesTerminal() { release(); }

std::error_code KestrelCursesTerminal::acquire() {
    if (screen_) {
        return {};
    }
    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) {
        spdlog::error("newterm() failed, is TERM set?");
        return KestrelError::SurfaceAcquireFailed;
    }
    set_term(screen_);
    if (cbreak() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
        spdlog::error("Unable to configure the terminal input mode");
        release();
        return KestrelError::SurfaceAcquireFailed;
    }
    if (set_escdelay(escapeDelayMs_) == ERR) {
        spdlog::warn("Unable to set the escape delay to {} ms", escapeDelayMs_);
    }
    if (curs_set(showCursor_ ? 1 : 0) == ERR) {
        spdlog::debug("Terminal does not support changing cursor visibility");
    }
    spdlog::info("Terminal acquired ({}x{})", COLS, LINES);
    return {};
}

std::error_code KestrelCursesTerminal::draw(const DrawCallback &callback) {
    if (!screen_) {
        return KestrelError::SurfaceNotAcquired;
    }
    int rows = 0;
    int cols = 0;
    getmaxyx(stdscr, rows, cols);
    if (rows != buffer_.getHeight() || cols != buffer_.getWidth()) {
        buffer_.resize(cols, rows);
    } else {
        buffer_.clear();
    }

    callback(buffer_.getArea(), buffer_);

    //  mvaddchnstr neither wraps nor advances the cursor, so the bottom-right cell
    //  can be written without scrolling the screen
    std::vector<chtype> line(size_t(cols) + 1, 0);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const KestrelCell *cell = buffer_.getCell(x, y);
            line[x] = chtype((unsigned char)cell->ch) | toCursesAttrs(cell->attrs);
        }
        if (mvaddchnstr(y, 0, line.data(), cols) == ERR) {
            return KestrelError::SurfaceDrawFailed;
        }
    }
    if (refresh() == ERR) {
        return KestrelError::SurfaceDrawFailed;
    }
    return {};
}

void KestrelCursesTerminal::release() {
    if (!screen_)
        return;
    if (endwin() == ERR) {
        spdlog::warn("endwin() failed while restoring the terminal");
    }
    delscreen(screen_);
    screen_ = nullptr;
    spdlog::info("Terminal released");
}

std::error_code KestrelCursesTerminal::readNextEvent(KestrelInputEvent &event) {
    if (!screen_) {
        return KestrelError::SurfaceNotAcquired;
    }
    int ch = wgetch(stdscr);
    if (ch == ERR) {
        return KestrelError::InputReadFailed;
    }
    if (ch == KEY_RESIZE) {
        event = KestrelInputEvent{};
        event.type = KestrelInputType::Resize;
        getmaxyx(stdscr, event.height, event.width);
        spdlog::debug("Terminal resized to {}x{}", event.width, event.height);
        return {};
    }
    event = kestrelTranslateCursesKey(ch);
    return {};
}
