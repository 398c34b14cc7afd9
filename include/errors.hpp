#pragma once

#include <stdexcept>
#include <string>

/// Image bytes could not be decoded (unreadable, truncated or unsupported)
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/// Pixel coordinate outside the buffer
class OutOfBounds : public std::out_of_range {
public:
    explicit OutOfBounds(const std::string& what) : std::out_of_range(what) {}
};

/// Zero-sized grid or buffer, or pixel data that does not match its size
class InvalidDimensions : public std::invalid_argument {
public:
    explicit InvalidDimensions(const std::string& what) : std::invalid_argument(what) {}
};

/// Malformed command-line argument
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& what) : std::invalid_argument(what) {}
};
