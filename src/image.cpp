#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#include "image.hpp"
#include "errors.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <memory>
#include <sstream>
#include <utility>

uint8_t luma(const Color& c) {
    double y = 0.299 * c.r + 0.587 * c.g + 0.114 * c.b;
    return static_cast<uint8_t>(std::clamp((int)std::lround(y), 0, 255));
}

PixelBuffer::PixelBuffer(uint32_t width, uint32_t height, Color fill)
    : width_(width), height_(height), pixels_(size_t(width) * height, fill) {
    if (width == 0 || height == 0) {
        throw InvalidDimensions("Pixel buffer must not be empty");
    }
}

PixelBuffer::PixelBuffer(uint32_t width, uint32_t height, std::vector<Color> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {
    if (width == 0 || height == 0) {
        throw InvalidDimensions("Pixel buffer must not be empty");
    }
    if (pixels_.size() != size_t(width) * height) {
        std::ostringstream oss;
        oss << "Pixel count " << pixels_.size() << " does not match "
            << width << "x" << height;
        throw InvalidDimensions(oss.str());
    }
}

Color PixelBuffer::sample(uint32_t x, uint32_t y) const {
    if (x >= width_ || y >= height_) {
        std::ostringstream oss;
        oss << "Pixel (" << x << ", " << y << ") outside "
            << width_ << "x" << height_ << " image";
        throw OutOfBounds(oss.str());
    }
    return at(x, y);
}

PixelBuffer PixelBuffer::to_grayscale() const {
    PixelBuffer gray = *this;
    for (auto& p : gray.pixels_) {
        uint8_t y = luma(p);
        p.r = y;
        p.g = y;
        p.b = y;
    }
    return gray;
}

// --- Decoding ---

PixelBuffer pixels_from_rgba(const uint8_t* rgba, uint32_t width, uint32_t height) {
    std::vector<Color> pixels(size_t(width) * height);
    for (size_t i = 0; i < pixels.size(); i++) {
        pixels[i] = {rgba[i * 4 + 0], rgba[i * 4 + 1], rgba[i * 4 + 2], rgba[i * 4 + 3]};
    }
    return PixelBuffer(width, height, std::move(pixels));
}

static PixelBuffer take_decoded(unsigned char* data, int w, int h) {
    std::unique_ptr<unsigned char, void (*)(void*)> owned(data, stbi_image_free);
    try {
        return pixels_from_rgba(owned.get(), (uint32_t)w, (uint32_t)h);
    } catch (const InvalidDimensions& e) {
        throw DecodeError(std::string("Decoded image has invalid size: ") + e.what());
    }
}

PixelBuffer load_image(const std::string& path) {
    int w, h, channels;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        throw DecodeError("Failed to load image: " + path +
                          " (" + stbi_failure_reason() + ")");
    }
    return take_decoded(data, w, h);
}

PixelBuffer load_image_from_memory(const uint8_t* bytes, size_t size) {
    if (size == 0 || size > size_t(INT_MAX)) {
        throw DecodeError("Failed to decode image: invalid buffer size");
    }
    int w, h, channels;
    unsigned char* data = stbi_load_from_memory(bytes, (int)size, &w, &h, &channels, 4);
    if (!data) {
        throw DecodeError(std::string("Failed to decode image (") + stbi_failure_reason() + ")");
    }
    return take_decoded(data, w, h);
}
