#pragma once

#include <optional>
#include <stdexcept>
#include <string>

// malformed bencode or torrent structure
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error("decode error: " + what) {}
};

class ClassificationError : public std::runtime_error {
public:
    explicit ClassificationError(const std::string& what) : std::runtime_error(what) {}
};

// every identification service consulted for a video release failed
class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error("config: " + what) {}
};

// network failure, timeout, 5xx, 408 or 429: worth another attempt
class TransientNetworkError : public std::runtime_error {
public:
    explicit TransientNetworkError(const std::string& what, std::optional<unsigned> status = std::nullopt)
        : std::runtime_error(what), status_(status) {}

    std::optional<unsigned> status() const { return status_; }

private:
    std::optional<unsigned> status_;
};

// non-transient failure reported by an identification service or torrent client
class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& what, std::optional<unsigned> status = std::nullopt)
        : std::runtime_error(what), status_(status) {}

    std::optional<unsigned> status() const { return status_; }

private:
    std::optional<unsigned> status_;
};

// failure scoped to a single tracker target
class TargetError : public std::runtime_error {
public:
    TargetError(const std::string& tracker, const std::string& what, std::optional<unsigned> status = std::nullopt)
        : std::runtime_error(tracker + ": " + what), tracker_(tracker), status_(status) {}

    const std::string& tracker() const { return tracker_; }
    std::optional<unsigned> status() const { return status_; }

private:
    std::string tracker_;
    std::optional<unsigned> status_;
};
