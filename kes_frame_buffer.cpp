#include "kes_frame_buffer.hpp"

#include <algorithm>

KestrelRect KestrelRect::intersect(const KestrelRect &other) const {
    int left = std::max(x, other.x);
    int top = std::max(y, other.y);
    int r = std::min(right(), other.right());
    int b = std::min(bottom(), other.bottom());
    if (r <= left || b <= top)
        return KestrelRect{left, top, 0, 0};
    return KestrelRect{left, top, r - left, b - top};
}

KestrelRect KestrelRect::inset(int dx, int dy) const {
    KestrelRect result{x + dx, y + dy, width - 2 * dx, height - 2 * dy};
    if (result.width < 0)
        result.width = 0;
    if (result.height < 0)
        result.height = 0;
    return result;
}

KestrelFrameBuffer::KestrelFrameBuffer(int width, int height) { resize(width, height); }

void KestrelFrameBuffer::resize(int width, int height) {
    width_ = std::max(width, 0);
    height_ = std::max(height, 0);
    cells_.assign(size_t(width_) * size_t(height_), KestrelCell{});
}

void KestrelFrameBuffer::clear() { std::fill(cells_.begin(), cells_.end(), KestrelCell{}); }

const KestrelCell *KestrelFrameBuffer::getCell(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_)
        return nullptr;
    return &cells_[size_t(y) * width_ + x];
}

void KestrelFrameBuffer::setCell(int x, int y, char ch, uint8_t attrs) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_)
        return;
    auto &cell = cells_[size_t(y) * width_ + x];
    cell.ch = ch;
    cell.attrs = attrs;
}

int KestrelFrameBuffer::putText(int x, int y, std::string_view text, uint8_t attrs,
                                const KestrelRect &clip) {
    auto bounds = clip.intersect(getArea());
    if (bounds.isEmpty() || y < bounds.y || y >= bounds.bottom())
        return 0;

    int written = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        int cx = x + int(i);
        if (cx >= bounds.right())
            break;
        if (cx < bounds.x)
            continue;
        char ch = text[i];
        //  control characters would corrupt the terminal output
        if ((unsigned char)ch < 0x20 || ch == 0x7f)
            ch = '?';
        setCell(cx, y, ch, attrs);
        ++written;
    }
    return written;
}

int KestrelFrameBuffer::putText(int x, int y, std::string_view text, uint8_t attrs) {
    return putText(x, y, text, attrs, getArea());
}

int KestrelFrameBuffer::putCenteredText(const KestrelRect &region, int y, std::string_view text,
                                        uint8_t attrs) {
    int x = region.x + (region.width - int(text.size())) / 2;
    if (x < region.x)
        x = region.x;
    return putText(x, y, text, attrs, region);
}

void KestrelFrameBuffer::fill(const KestrelRect &region, char ch, uint8_t attrs) {
    auto bounds = region.intersect(getArea());
    for (int cy = bounds.y; cy < bounds.bottom(); ++cy) {
        for (int cx = bounds.x; cx < bounds.right(); ++cx) {
            setCell(cx, cy, ch, attrs);
        }
    }
}

void KestrelFrameBuffer::drawBox(const KestrelRect &region, uint8_t attrs) {
    if (region.width < 2 || region.height < 2)
        return;
    int left = region.x;
    int top = region.y;
    int right = region.right() - 1;
    int bottom = region.bottom() - 1;
    for (int cx = left + 1; cx < right; ++cx) {
        setCell(cx, top, '-', attrs);
        setCell(cx, bottom, '-', attrs);
    }
    for (int cy = top + 1; cy < bottom; ++cy) {
        setCell(left, cy, '|', attrs);
        setCell(right, cy, '|', attrs);
    }
    setCell(left, top, '+', attrs);
    setCell(right, top, '+', attrs);
    setCell(left, bottom, '+', attrs);
    setCell(right, bottom, '+', attrs);
}

std::string KestrelFrameBuffer::getRowText(int y) const {
    std::string row;
    if (y < 0 || y >= height_)
        return row;
    row.reserve(width_);
    for (int x = 0; x < width_; ++x) {
        row.push_back(cells_[size_t(y) * width_ + x].ch);
    }
    return row;
}
