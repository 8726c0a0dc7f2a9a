#include "request_executor.hpp"
#include "json_path.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

bool is_token_char(char c) {
    static const std::string extra = "!#$%&'*+-.^_`|~";
    return std::isalnum(static_cast<unsigned char>(c)) || extra.find(c) != std::string::npos;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int parse_status_code(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::runtime_error("Invalid status code: " + text);
    }
    int code = std::stoi(text);
    if (code > 65535) {
        throw std::runtime_error("Invalid status code: " + text);
    }
    return code;
}

} // namespace

ParsedUrl parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("Invalid URL: " + url);
    }

    std::string scheme = lowercase(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Invalid URL: " + url);
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos) authority_end = url.size();

    std::string authority = url.substr(authority_start, authority_end - authority_start);
    if (authority.empty() || authority[0] == ':' ||
        std::any_of(authority.begin(), authority.end(),
                    [](unsigned char c) { return std::isspace(c) || c == '{' || c == '}'; })) {
        throw std::invalid_argument("Invalid URL: " + url);
    }

    std::string rest = url.substr(authority_end);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos) rest.erase(fragment);
    if (rest.empty() || rest[0] == '?') rest.insert(0, "/");

    if (std::any_of(rest.begin(), rest.end(), [](unsigned char c) { return std::isspace(c); })) {
        throw std::invalid_argument("Invalid URL: " + url);
    }

    return ParsedUrl{scheme + "://" + authority, rest};
}

std::string parse_method(const std::string& method) {
    if (method.empty() || !std::all_of(method.begin(), method.end(), is_token_char)) {
        throw std::invalid_argument("Invalid HTTP method: " + method);
    }
    return method;
}

RequestExecutor::RequestExecutor(std::chrono::milliseconds timeout) : timeout_(timeout) {}

TestResult RequestExecutor::execute(const std::string& name,
                                    const Request& request,
                                    const std::optional<Expectation>& expect,
                                    const VariableContext& context,
                                    ClientPool* clients) const {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time] {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_time);
    };

    TestResult result;
    result.name = name;

    httplib::Result res;
    try {
        res = send(request, context, clients);
    } catch (const std::exception& e) {
        result.duration = elapsed();
        result.error = e.what();
        spdlog::debug("{}: request not sent: {}", name, e.what());
        return result;
    }

    result.duration = elapsed();

    if (!res) {
        result.error = "Failed to send HTTP request: " + httplib::to_string(res.error());
        spdlog::debug("{}: transport error: {}", name, *result.error);
        return result;
    }

    const int status = res->status;
    result.response_status = status;
    result.response_body = res->body;

    if (!expect) {
        result.passed = status < 400;
        if (!result.passed) {
            result.error = "HTTP " + std::to_string(status);
        }
        return result;
    }

    try {
        validate(status, res->body, *expect, context);
        result.passed = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

httplib::Client& ClientPool::get(const std::string& scheme_host_port) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(scheme_host_port);
    if (it != clients_.end()) return *it->second;

    auto cli = std::make_unique<httplib::Client>(scheme_host_port);
    if (!cli->is_valid()) {
        throw std::invalid_argument("Invalid URL: " + scheme_host_port);
    }
    configure(*cli);
    cli->set_keep_alive(true);
    cli->set_tcp_nodelay(true);
    return *clients_.emplace(scheme_host_port, std::move(cli)).first->second;
}

void ClientPool::set_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timeout == timeout_) return;
    timeout_ = timeout;
    for (auto& [base, cli] : clients_) configure(*cli);
}

void ClientPool::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [base, cli] : clients_) cli->stop();
}

size_t ClientPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

void ClientPool::configure(httplib::Client& cli) const {
    cli.set_connection_timeout(timeout_);
    cli.set_read_timeout(timeout_);
    cli.set_write_timeout(timeout_);
    cli.set_follow_location(true);
}

httplib::Result RequestExecutor::send(const Request& request, const VariableContext& context,
                                      ClientPool* clients) const {
    const std::string url_text = context.substitute(request.url);
    ParsedUrl url = parse_url(url_text);

    httplib::Params params;
    if (request.params) {
        for (const auto& [key, value] : *request.params) {
            params.emplace(context.substitute(key), context.substitute(value));
        }
    }

    httplib::Request req;
    req.method = parse_method(request.method);
    req.path = params.empty() ? url.path : httplib::append_query_params(url.path, params);

    if (request.headers) {
        for (const auto& [key, value] : *request.headers) {
            req.headers.emplace(context.substitute(key), context.substitute(value));
        }
    }

    if (request.body) {
        req.body = context.substitute(*request.body);
    }

    spdlog::trace("{} {}{}", req.method, url.scheme_host_port, req.path);
    if (clients) {
        return clients->get(url.scheme_host_port).send(req);
    }

    httplib::Client cli(url.scheme_host_port);
    if (!cli.is_valid()) {
        throw std::invalid_argument("Invalid URL: " + url_text);
    }
    cli.set_connection_timeout(timeout_);
    cli.set_read_timeout(timeout_);
    cli.set_write_timeout(timeout_);
    cli.set_follow_location(true);
    return cli.send(req);
}

void RequestExecutor::validate(int status, const std::string& body,
                               const Expectation& expect, const VariableContext& context) const {
    if (expect.status) {
        int expected_code = 0;
        if (std::holds_alternative<int>(*expect.status)) {
            expected_code = std::get<int>(*expect.status);
        } else {
            expected_code = parse_status_code(context.substitute(std::get<std::string>(*expect.status)));
        }

        if (status != expected_code) {
            throw std::runtime_error("Expected status " + std::to_string(expected_code) +
                                     " but got " + std::to_string(status));
        }
    }

    // Header expectations are carried in the model but not evaluated.

    if (expect.jsonpath && !expect.jsonpath->empty()) {
        json document = json::parse(body, nullptr, false);
        if (document.is_discarded()) {
            throw std::runtime_error("Response body is not valid JSON");
        }

        for (const auto& [path, expected] : *expect.jsonpath) {
            assert_json_path(document, path, expected, context);
        }
    }
}
