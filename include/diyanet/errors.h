#pragma once

#include <stdexcept>
#include <string>

namespace diyanet {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Transport failure, HTTP error status, or a body that is not text.
class FetchError : public Error {
public:
    FetchError(const std::string& url, const std::string& cause)
        : Error("Failed to fetch '" + url + "': " + cause), url_(url), cause_(cause) {}

    const std::string& url() const { return url_; }
    const std::string& cause() const { return cause_; }

private:
    std::string url_;
    std::string cause_;
};

enum class UnitKind {
    Country,
    State,
    Region
};

const char* to_string(UnitKind kind);

class NotFoundError : public Error {
public:
    NotFoundError(UnitKind kind, const std::string& name);

    UnitKind kind() const { return kind_; }
    const std::string& name() const { return name_; }

private:
    UnitKind kind_;
    std::string name_;
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& message) : Error(message) {}
};

class TimeFormatError : public Error {
public:
    explicit TimeFormatError(const std::string& value)
        : Error("Invalid time of day: '" + value + "'"), value_(value) {}

    const std::string& value() const { return value_; }

private:
    std::string value_;
};

class CacheDirError : public Error {
public:
    explicit CacheDirError(const std::string& message) : Error(message) {}
};

class CacheError : public Error {
public:
    explicit CacheError(const std::string& message) : Error(message) {}
};

} // namespace diyanet
