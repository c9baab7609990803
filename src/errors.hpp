#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace map_tail {

// Invalid constructor parameters or configuration file
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// File bytes are not valid text under the single-byte decoder
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& what, std::uint64_t offset)
        : std::runtime_error(what)
        , offset_(offset)
    {
    }

    std::uint64_t offset() const { return offset_; }

private:
    std::uint64_t offset_;
};

// File missing, permission denied, mapping failure
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

// Failure to establish or maintain the filesystem watch
class WatchError : public std::runtime_error {
public:
    explicit WatchError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace map_tail
