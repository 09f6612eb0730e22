#pragma once

#include <stdexcept>
#include <string>

namespace stack_clip {

class StackClipError : public std::runtime_error {
public:
    explicit StackClipError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public StackClipError {
public:
    explicit ConfigError(const std::string& message)
        : StackClipError("Config error: " + message) {}
};

class ValidationError : public StackClipError {
public:
    explicit ValidationError(const std::string& message)
        : StackClipError("Validation error: " + message) {}
};

// Column depth exceeds the working buffer capacity
class CapacityError : public ValidationError {
public:
    CapacityError(int num_images, int capacity)
        : ValidationError("stack depth " + std::to_string(num_images) +
                          " exceeds working buffer capacity " +
                          std::to_string(capacity)),
          num_images_(num_images), capacity_(capacity) {}

    int num_images() const { return num_images_; }
    int capacity() const { return capacity_; }

private:
    int num_images_;
    int capacity_;
};

class IOError : public StackClipError {
public:
    explicit IOError(const std::string& message)
        : StackClipError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class StopRequested : public StackClipError {
public:
    StopRequested() : StackClipError("Stop requested by user") {}
};

} // namespace stack_clip
