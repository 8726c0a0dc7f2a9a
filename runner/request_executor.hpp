#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <httplib.h>

#include "TestResults.hpp"
#include "suite.h"
#include "variable_context.hpp"

// "http://host:port" plus "/path?query", split for httplib::Client.
struct ParsedUrl {
    std::string scheme_host_port;
    std::string path;
};

// Throws std::invalid_argument("Invalid URL: ...") for anything that is not
// an absolute http(s) URL with a host.
ParsedUrl parse_url(const std::string& url);

// Throws std::invalid_argument("Invalid HTTP method: ...") unless the
// method is a non-empty RFC 7230 token.
std::string parse_method(const std::string& method);

/**
 * @brief Persistent keep-alive clients, one per scheme://host:port.
 *
 * Owned by a single worker thread, which is the only one sending through
 * it. stop() may be called from any thread and aborts the request in
 * flight; the sender then sees a transport error.
 */
class ClientPool {
public:
    explicit ClientPool(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    ClientPool(const ClientPool&) = delete;
    ClientPool& operator=(const ClientPool&) = delete;

    // Throws std::invalid_argument when no client can be built for the base.
    httplib::Client& get(const std::string& scheme_host_port);

    // Applies to pooled clients and to those created later.
    void set_timeout(std::chrono::milliseconds timeout);

    void stop();

    size_t size() const;

private:
    void configure(httplib::Client& cli) const;

    mutable std::mutex mutex_;
    std::chrono::milliseconds timeout_;
    std::map<std::string, std::unique_ptr<httplib::Client>> clients_;
};

/**
 * @brief Issues one templated HTTP request and checks it against an
 * expectation.
 *
 * execute() never throws: malformed input, transport failures and
 * assertion failures all come back as a failed TestResult. A result with
 * no response_status means the request never got a response.
 */
class RequestExecutor {
public:
    explicit RequestExecutor(std::chrono::milliseconds timeout);

    // Without a pool every call opens (and closes) its own connection.
    TestResult execute(const std::string& name,
                       const Request& request,
                       const std::optional<Expectation>& expect,
                       const VariableContext& context,
                       ClientPool* clients = nullptr) const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    httplib::Result send(const Request& request, const VariableContext& context, ClientPool* clients) const;

    // Throws std::runtime_error describing the first failed check.
    void validate(int status, const std::string& body,
                  const Expectation& expect, const VariableContext& context) const;

    std::chrono::milliseconds timeout_;
};
