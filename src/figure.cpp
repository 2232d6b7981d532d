#include "figure.hpp"
#include "base64.hpp"
#include "errors.hpp"

#include <png.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace framelink {

namespace {
    // png_image_free is a no-op on an image that was never opened or is already freed.
    struct PngImageGuard {
        png_image& image;
        ~PngImageGuard() { png_image_free(&image); }
    };

    struct FigureReleaser {
        Figure& figure;
        ~FigureReleaser() { figure.release(); }
    };

    std::string png_message(const png_image& image) {
        return image.message[0] != '\0' ? std::string(image.message) : std::string("unknown libpng error");
    }
}

Figure::Figure(unsigned width, unsigned height, Color background)
    : width_(width), height_(height) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("figure dimensions must be non-zero");
    }
    pixels_.resize(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = background.r;
        pixels_[i + 1] = background.g;
        pixels_[i + 2] = background.b;
        pixels_[i + 3] = background.a;
    }
}

void Figure::put(int x, int y, Color c) {
    if (x < 0 || y < 0 || x >= static_cast<int>(width_) || y >= static_cast<int>(height_)) {
        return;
    }
    const size_t off = (static_cast<size_t>(y) * width_ + static_cast<size_t>(x)) * 4;
    pixels_[off] = c.r;
    pixels_[off + 1] = c.g;
    pixels_[off + 2] = c.b;
    pixels_[off + 3] = c.a;
}

void Figure::fill_rect(int x, int y, int w, int h, Color c) {
    if (released_) {
        throw std::logic_error("drawing on a released figure");
    }
    const int x0 = std::max(x, 0);
    const int y0 = std::max(y, 0);
    const int x1 = std::min(x + w, static_cast<int>(width_));
    const int y1 = std::min(y + h, static_cast<int>(height_));
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            put(px, py, c);
        }
    }
}

void Figure::draw_line(int x0, int y0, int x1, int y1, Color c) {
    if (released_) {
        throw std::logic_error("drawing on a released figure");
    }
    // Bresenham
    const int dx = std::abs(x1 - x0);
    const int dy = -std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    for (;;) {
        put(x0, y0, c);
        if (x0 == x1 && y0 == y1) {
            break;
        }
        const int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

void Figure::plot_bars(const std::vector<double>& values, Color bar) {
    const int w = static_cast<int>(width_);
    const int h = static_cast<int>(height_);
    const int margin = std::max(2, std::min(w, h) / 10);
    const int plot_w = w - 2 * margin;
    const int plot_h = h - 2 * margin;
    const int base_y = h - margin;

    draw_line(margin, margin, margin, base_y, kBlack);
    draw_line(margin, base_y, w - margin, base_y, kBlack);

    if (values.empty() || plot_w <= 0 || plot_h <= 0) {
        return;
    }
    double peak = 0.0;
    for (double v : values) {
        if (std::isfinite(v) && v > peak) {
            peak = v;
        }
    }
    if (peak <= 0.0) {
        return;
    }

    const int slot = std::max(1, plot_w / static_cast<int>(values.size()));
    const int bar_w = std::max(1, slot * 4 / 5);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i]) || values[i] <= 0.0) {
            continue;
        }
        const int bar_h = std::min(plot_h, static_cast<int>(values[i] / peak * plot_h));
        const int x = margin + 1 + static_cast<int>(i) * slot + (slot - bar_w) / 2;
        fill_rect(x, base_y - bar_h, bar_w, bar_h, bar);
    }
}

Color Figure::pixel(unsigned x, unsigned y) const {
    if (released_) {
        throw std::logic_error("reading a released figure");
    }
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("pixel outside figure");
    }
    const size_t off = (static_cast<size_t>(y) * width_ + x) * 4;
    return Color{pixels_[off], pixels_[off + 1], pixels_[off + 2], pixels_[off + 3]};
}

void Figure::release() {
    std::vector<uint8_t>().swap(pixels_);
    released_ = true;
}

Color Image::pixel(unsigned x, unsigned y) const {
    if (x >= width || y >= height) {
        throw std::out_of_range("pixel outside image");
    }
    const size_t off = (static_cast<size_t>(y) * width + x) * 4;
    return Color{rgba[off], rgba[off + 1], rgba[off + 2], rgba[off + 3]};
}

std::string encode_figure(Figure& figure) {
    if (figure.released()) {
        throw std::logic_error("figure was already released");
    }
    FigureReleaser releaser{figure};

    png_image image;
    std::memset(&image, 0, sizeof(image));
    PngImageGuard guard{image};
    image.version = PNG_IMAGE_VERSION;
    image.width = figure.width();
    image.height = figure.height();
    image.format = PNG_FORMAT_RGBA;

    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(&image, nullptr, &size, 0, figure.rgba().data(), 0, nullptr)) {
        throw std::runtime_error("PNG sizing failed: " + png_message(image));
    }

    std::vector<uint8_t> png(size);
    if (!png_image_write_to_memory(&image, png.data(), &size, 0, figure.rgba().data(), 0, nullptr)) {
        throw std::runtime_error("PNG encoding failed: " + png_message(image));
    }
    png.resize(size);

    return base64_encode(png);
}

Image decode_figure(const std::string& text) {
    const std::vector<uint8_t> png = base64_decode(text);

    png_image image;
    std::memset(&image, 0, sizeof(image));
    PngImageGuard guard{image};
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, png.data(), png.size())) {
        throw ProtocolError(ErrorKind::MalformedPayload, "figure is not a PNG: " + png_message(image));
    }

    const uint64_t pixels = static_cast<uint64_t>(image.width) * image.height;
    if (pixels > kMaxFigurePixels) {
        throw ProtocolError(ErrorKind::MalformedPayload,
                            "figure of " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                                " exceeds the decode limit");
    }

    image.format = PNG_FORMAT_RGBA;
    Image out;
    out.width = image.width;
    out.height = image.height;
    out.rgba.resize(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(&image, nullptr, out.rgba.data(), 0, nullptr)) {
        throw ProtocolError(ErrorKind::MalformedPayload, "PNG decoding failed: " + png_message(image));
    }
    return out;
}

} // namespace framelink
