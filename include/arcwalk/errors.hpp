#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace arcwalk {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
    virtual const char* Kind() const noexcept { return "error"; }
};

// Missing source path, bad option values, duplicate roots.
class ConfigurationError : public Error {
public:
    using Error::Error;
    const char* Kind() const noexcept override { return "configuration"; }
};

class InsufficientSpaceError : public Error {
public:
    InsufficientSpaceError(const std::string& message, std::uint64_t needed, std::uint64_t available)
        : Error(message), needed_(needed), available_(available) {}
    const char* Kind() const noexcept override { return "insufficient-space"; }

    std::uint64_t Needed() const noexcept { return needed_; }
    std::uint64_t Available() const noexcept { return available_; }

private:
    std::uint64_t needed_ = 0;
    std::uint64_t available_ = 0;
};

class EmptyInputError : public Error {
public:
    using Error::Error;
    const char* Kind() const noexcept override { return "empty-input"; }
};

// Raised by external-tool strategies when the compressor is gone; the executor falls back.
class ToolNotFoundError : public Error {
public:
    using Error::Error;
    const char* Kind() const noexcept override { return "tool-not-found"; }
};

class ArchiveError : public Error {
public:
    using Error::Error;
    const char* Kind() const noexcept override { return "archive"; }
};

class ExternalProcessError : public ArchiveError {
public:
    ExternalProcessError(const std::string& message, int exit_code, std::string output)
        : ArchiveError(message), exit_code_(exit_code), output_(std::move(output)) {}
    const char* Kind() const noexcept override { return "external-process"; }

    int ExitCode() const noexcept { return exit_code_; }
    const std::string& Output() const noexcept { return output_; }

private:
    int exit_code_ = 0;
    std::string output_;
};

class ManifestError : public Error {
public:
    using Error::Error;
    const char* Kind() const noexcept override { return "manifest"; }
};

}  // namespace arcwalk
