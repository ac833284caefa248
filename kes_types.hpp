#ifndef KES_TYPES_HPP
#define KES_TYPES_HPP

#include <cstdint>

/**
 * @brief A rectangular region in terminal cells.
 *
 * Origin is the top-left cell of the terminal.  Regions with a zero or negative
 * extent are empty and clip everything drawn into them.
 */
struct KestrelRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool isEmpty() const { return width <= 0 || height <= 0; }
    int right() const { return x + width; }
    int bottom() const { return y + height; }
    bool contains(int cx, int cy) const {
        return cx >= x && cx < right() && cy >= y && cy < bottom();
    }

    KestrelRect intersect(const KestrelRect &other) const;
    //  shrinks the region by dx columns on the left and right, dy rows on the top and bottom
    KestrelRect inset(int dx, int dy) const;
};

enum KestrelCellAttr : uint8_t {
    kKestrelAttr_None = 0,
    kKestrelAttr_Bold = 1 << 0,
    kKestrelAttr_Reverse = 1 << 1,
    kKestrelAttr_Underline = 1 << 2,
    kKestrelAttr_Dim = 1 << 3
};

struct KestrelCell {
    char ch = ' ';
    uint8_t attrs = kKestrelAttr_None;
};

enum class KestrelInputType { None, Key, Resize };

enum class KestrelKey {
    None,
    Character,
    Enter,
    Escape,
    Backspace,
    Tab,
    BackTab,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
    Delete,
    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12
};

enum KestrelModifier : unsigned {
    kKestrelModifier_None = 0,
    kKestrelModifier_Ctrl = 1 << 0,
    kKestrelModifier_Shift = 1 << 1
};

/**
 * @brief One decoded input event read from the terminal.
 *
 * For Key events, `key` names the key.  When `key` is Character, `character`
 * holds the typed character (with Ctrl set in `modifiers` for control codes
 * decoded as Ctrl+letter.)  Resize events carry the new terminal size in
 * `width` and `height`.
 */
struct KestrelInputEvent {
    KestrelInputType type = KestrelInputType::None;
    KestrelKey key = KestrelKey::None;
    char character = 0;
    unsigned modifiers = kKestrelModifier_None;
    int width = 0;
    int height = 0;

    bool isCharacter(char c) const {
        return type == KestrelInputType::Key && key == KestrelKey::Character &&
               character == c && !(modifiers & kKestrelModifier_Ctrl);
    }
    bool isKey(KestrelKey k) const { return type == KestrelInputType::Key && key == k; }
};

#endif
