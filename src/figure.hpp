#ifndef FRAMELINK_FIGURE_HPP
#define FRAMELINK_FIGURE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace framelink {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

constexpr Color kWhite{255, 255, 255, 255};
constexpr Color kBlack{0, 0, 0, 255};

// Largest raster decode_figure will allocate for, 4096 x 4096.
constexpr uint64_t kMaxFigurePixels = 4096ull * 4096ull;

// RGBA drawing surface for rendered charts. Owns its pixel memory until release().
class Figure {
public:
    Figure(unsigned width, unsigned height, Color background = kWhite);

    unsigned width() const { return width_; }
    unsigned height() const { return height_; }

    // Drawing is clipped to the surface.
    void fill_rect(int x, int y, int w, int h, Color c);
    void draw_line(int x0, int y0, int x1, int y1, Color c);
    // Axes along the left and bottom edges, one bar per value scaled to the largest finite one.
    // Negative and non-finite values draw no bar.
    void plot_bars(const std::vector<double>& values, Color bar);

    Color pixel(unsigned x, unsigned y) const;
    const std::vector<uint8_t>& rgba() const { return pixels_; }

    void release();
    bool released() const { return released_; }

private:
    void put(int x, int y, Color c);

    unsigned width_;
    unsigned height_;
    std::vector<uint8_t> pixels_;
    bool released_ = false;
};

// Decoded raster, RGBA, row-major.
struct Image {
    unsigned width = 0;
    unsigned height = 0;
    std::vector<uint8_t> rgba;

    Color pixel(unsigned x, unsigned y) const;
};

// Renders to PNG and base64-encodes it. The figure is released on return, also on failure.
// Throws std::logic_error if the figure was already released.
std::string encode_figure(Figure& figure);

// Throws ProtocolError(MalformedPayload), also for images above kMaxFigurePixels.
Image decode_figure(const std::string& text);

} // namespace framelink

#endif // FRAMELINK_FIGURE_HPP
