#pragma once

#include <stdexcept>
#include <string>

// Zero providers, or any other unusable configuration handed to a constructor.
class ConstructionError : public std::invalid_argument {
public:
    explicit ConstructionError(const std::string& what) : std::invalid_argument(what) {}
};

// libcurl could not complete the exchange.
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, bool timed_out)
        : std::runtime_error(what), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

// Non-2xx status, unparseable body, or a JSON-RPC error object.
class RpcError : public std::runtime_error {
public:
    explicit RpcError(const std::string& what, long http_status = 0)
        : std::runtime_error(what), http_status_(http_status) {}

    long http_status() const { return http_status_; }

private:
    long http_status_;
};

class AllProvidersExhausted : public std::runtime_error {
public:
    AllProvidersExhausted(int attempts, const std::string& last_provider, const std::string& last_error)
        : std::runtime_error("All providers failed after " + std::to_string(attempts) +
                             " attempts. Last error (" + last_provider + "): " + last_error)
        , attempts_(attempts)
        , last_provider_(last_provider)
        , last_error_(last_error) {}

    int attempts() const { return attempts_; }
    const std::string& last_provider() const { return last_provider_; }
    const std::string& last_error() const { return last_error_; }

private:
    int attempts_;
    std::string last_provider_;
    std::string last_error_;
};

class TransactionBuildError : public std::runtime_error {
public:
    explicit TransactionBuildError(const std::string& what) : std::runtime_error(what) {}
};

class TransactionSubmitError : public std::runtime_error {
public:
    explicit TransactionSubmitError(const std::string& what) : std::runtime_error(what) {}
};
