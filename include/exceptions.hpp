#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_NOT_READY,
    ERR_INSUFFICIENT_SAMPLES,
    ERR_EXCESSIVE_DEVIATION,
    ERR_INVALID_GAIN,
    ERR_TIMEOUT,
    ERR_CONFIG,
    ERR_STORAGE,
    ERR_UNKNOWN
};

class ConfigException : public std::exception {
public:
    ConfigException(const std::string& msg, ErrorCode code = ERR_CONFIG) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~ConfigException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};
