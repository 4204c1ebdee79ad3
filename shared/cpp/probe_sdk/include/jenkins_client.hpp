#pragma once
#include <optional>
#include <stdexcept>
#include <string>

class Trace;

// Transport failure: connect, TLS, timeout or non-2xx status.
class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& url, const std::string& reason);

    const std::string& url() const { return url_; }
    const std::string& reason() const { return reason_; }

private:
    std::string url_;
    std::string reason_;
};

struct ClientConfig {
    std::string base_url;
    std::string user_agent{"jenkins-probes"};
    long timeout_s{10};
    std::optional<std::string> proxy;
    bool no_proxy{false};
    bool insecure{false};
    std::string username; // basic auth only when both are set
    std::string password;
};

// Returns the proxy to hand to libcurl: a URL, "" to disable proxying,
// or nullopt to leave libcurl's own environment handling in place.
std::optional<std::string> resolve_proxy(const std::optional<std::string>& explicit_proxy,
                                         bool no_proxy,
                                         const std::string& env_proxy);

class JenkinsClient {
public:
    JenkinsClient(ClientConfig cfg, const Trace& trace);

    std::string api_url(const std::string& tree) const;

    // GET {base}/api/json?tree=<tree>, returns the response body.
    std::string fetch(const std::string& tree) const;

private:
    ClientConfig cfg_;
    const Trace& trace_;
};
