#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct ConversionConfig;

/// 8-bit RGBA color
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    /// Pack RGB into 0xRRGGBB, alpha ignored
    uint32_t rgb24() const { return (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b); }

    bool same_rgb(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
};

inline bool operator==(const Color& x, const Color& y) {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}

inline bool operator!=(const Color& x, const Color& y) { return !(x == y); }

/// Luma with 0.299/0.587/0.114 weights, rounded and clamped to [0, 255]
uint8_t luma(const Color& c);

/// Decoded image: width * height RGBA samples, row-major
class PixelBuffer {
public:
    PixelBuffer() = default;

    /// Create a buffer filled with one color
    PixelBuffer(uint32_t width, uint32_t height, Color fill = Color{});

    /// Take ownership of row-major pixels; throws InvalidDimensions if
    /// pixels.size() != width * height or either side is zero
    PixelBuffer(uint32_t width, uint32_t height, std::vector<Color> pixels);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    bool empty() const { return pixels_.empty(); }

    const std::vector<Color>& pixels() const { return pixels_; }

    /// Pixel at (x, y); throws OutOfBounds
    Color sample(uint32_t x, uint32_t y) const;

    /// Unchecked access for internal loops
    const Color& at(uint32_t x, uint32_t y) const { return pixels_[size_t(y) * width_ + x]; }
    void set(uint32_t x, uint32_t y, Color c) { pixels_[size_t(y) * width_ + x] = c; }

    /// New buffer with every pixel replaced by its luma; alpha kept
    PixelBuffer to_grayscale() const;

    /// Render with the given configuration (see convert_to_ansi)
    std::string to_ansi(const ConversionConfig& config) const;

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<Color> pixels_;
};

/// Wrap 8-bit RGBA bytes (as produced by the decoder) into a PixelBuffer
PixelBuffer pixels_from_rgba(const uint8_t* rgba, uint32_t width, uint32_t height);

/// Load and decode an image file (PNG, JPEG, GIF, BMP, PNM, ...)
/// Throws DecodeError with the path and the decoder's reason
PixelBuffer load_image(const std::string& path);

/// Decode an in-memory image; throws DecodeError
PixelBuffer load_image_from_memory(const uint8_t* data, size_t size);
