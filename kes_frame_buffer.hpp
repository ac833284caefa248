#ifndef KES_FRAME_BUFFER_HPP
#define KES_FRAME_BUFFER_HPP

#include "kes_types.hpp"

#include <string>
#include <string_view>
#include <vector>

/**
 * @brief The character grid a view paints into during a draw.
 *
 * The terminal surface sizes and clears the buffer before each draw, hands it
 * to the active view and then presents its contents.  All writes are clipped
 * to the buffer area; writes outside it are dropped.
 */
class KestrelFrameBuffer {
  public:
    KestrelFrameBuffer() = default;
    KestrelFrameBuffer(int width, int height);

    void resize(int width, int height);
    void clear();

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    KestrelRect getArea() const { return KestrelRect{0, 0, width_, height_}; }

    //  nullptr if the coordinates are outside the buffer
    const KestrelCell *getCell(int x, int y) const;
    void setCell(int x, int y, char ch, uint8_t attrs = kKestrelAttr_None);

    //  writes a single line of text clipped to clip, returning the number of columns written
    int putText(int x, int y, std::string_view text, uint8_t attrs, const KestrelRect &clip);
    int putText(int x, int y, std::string_view text, uint8_t attrs = kKestrelAttr_None);
    //  centers text horizontally within region on row y
    int putCenteredText(const KestrelRect &region, int y, std::string_view text,
                        uint8_t attrs = kKestrelAttr_None);

    void fill(const KestrelRect &region, char ch, uint8_t attrs = kKestrelAttr_None);
    //  ASCII frame along the edges of region
    void drawBox(const KestrelRect &region, uint8_t attrs = kKestrelAttr_None);

    //  the row's text without attributes (useful for diagnostics and tests)
    std::string getRowText(int y) const;

  private:
    int width_ = 0;
    int height_ = 0;
    std::vector<KestrelCell> cells_;
};

#endif
