#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class HotpackException : public std::runtime_error {
public:
    explicit HotpackException(const std::string& message)
        : std::runtime_error(message) {}
};

// Raw reference refused by the trust gate; recoverable with `verify`.
class UntrustedReferenceError : public HotpackException {
public:
    using HotpackException::HotpackException;
};

// Bare name that the registry does not know, or a malformed reference.
class InvalidReferenceError : public HotpackException {
public:
    using HotpackException::HotpackException;
};

class FetchFailedError : public HotpackException {
public:
    FetchFailedError(const std::string& message, long status, std::string attribution)
        : HotpackException(message), status_(status), attribution_(std::move(attribution)) {}

    long status() const { return status_; }
    const std::string& attribution() const { return attribution_; }

private:
    long status_;
    std::string attribution_;
};

class UnsupportedPlatformError : public HotpackException {
public:
    using HotpackException::HotpackException;
};

class ActivationFailedError : public HotpackException {
public:
    ActivationFailedError(const std::string& message, std::string module_name)
        : HotpackException(message), module_name_(std::move(module_name)) {}

    const std::string& module_name() const { return module_name_; }

private:
    std::string module_name_;
};

class PackageNotFoundError : public HotpackException {
public:
    using HotpackException::HotpackException;
};

// Another install/uninstall of the same package holds its lock.
class PackageBusyError : public HotpackException {
public:
    using HotpackException::HotpackException;
};
