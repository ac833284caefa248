#ifndef KES_HOST_CURSES_TERMINAL_HPP
#define KES_HOST_CURSES_TERMINAL_HPP

#include "kes_frame_buffer.hpp"
#include "kes_terminal.hpp"
#include "kes_types.hpp"

#include <system_error>

//  avoids pulling curses.h (and its macros) into every includer
struct screen;

/**
 * @brief ncurses backed terminal surface and input event source.
 *
 * acquire() starts curses on stdin/stdout in cbreak/noecho mode with keypad
 * decoding, draw() presents a KestrelFrameBuffer and readNextEvent() blocks in
 * wgetch() for the next key or resize.  release() ends curses and restores the
 * terminal; it is safe to call more than once.
 */
class KestrelCursesTerminal : public KestrelTerminalSurface, public KestrelEventSource {
  public:
    KestrelCursesTerminal(bool showCursor, int escapeDelayMs);
    ~KestrelCursesTerminal() override;

    KestrelCursesTerminal(const KestrelCursesTerminal &) = delete;
    KestrelCursesTerminal &operator=(const KestrelCursesTerminal &) = delete;

    std::error_code acquire() override;
    std::error_code draw(const DrawCallback &callback) override;
    void release() override;

    std::error_code readNextEvent(KestrelInputEvent &event) override;

    bool isAcquired() const { return screen_ != nullptr; }

  private:
    struct screen *screen_ = nullptr;
    bool showCursor_;
    int escapeDelayMs_;
    KestrelFrameBuffer buffer_;
};

//  Decodes a wgetch() key code (other than ERR and KEY_RESIZE) into an input
//  event.  Codes without a mapping produce an event of type None.
KestrelInputEvent kestrelTranslateCursesKey(int ch);

#endif
