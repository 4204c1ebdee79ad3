#include "../include/jenkins_client.hpp"
#include "../include/trace.hpp"
#include <curl/curl.h>
#include <cstdlib>

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}
}

FetchError::FetchError(const std::string& url, const std::string& reason)
    : std::runtime_error("Failed retrieving " + url + " (" + reason + ")"), url_(url), reason_(reason) {}

std::optional<std::string> resolve_proxy(const std::optional<std::string>& explicit_proxy,
                                         bool no_proxy,
                                         const std::string& env_proxy) {
    if (explicit_proxy) return explicit_proxy;
    if (no_proxy) return std::string();
    if (!env_proxy.empty()) return env_proxy;
    return std::nullopt;
}

JenkinsClient::JenkinsClient(ClientConfig cfg, const Trace& trace) : cfg_(std::move(cfg)), trace_(trace) {
    if (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') cfg_.base_url.pop_back();
}

std::string JenkinsClient::api_url(const std::string& tree) const {
    return cfg_.base_url + "/api/json?tree=" + tree;
}

std::string JenkinsClient::fetch(const std::string& tree) const {
    CurlHandle c;
    std::string url = api_url(tree);
    std::string buf;
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = 0;

    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT, cfg_.timeout_s);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_MAXREDIRS, 7L);

    if (cfg_.insecure) {
        curl_easy_setopt(c.h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(c.h, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    auto env_proxy = getenv_or("http_proxy", getenv_or("HTTP_PROXY", ""));
    auto proxy = resolve_proxy(cfg_.proxy, cfg_.no_proxy, env_proxy);
    if (proxy) {
        trace_.line(proxy->empty() ? "Proxy disabled" : "Using proxy " + *proxy);
        curl_easy_setopt(c.h, CURLOPT_PROXY, proxy->c_str());
    }

    if (!cfg_.username.empty() && !cfg_.password.empty()) {
        trace_.line("Attempting HTTP basic auth as user: " + cfg_.username);
        curl_easy_setopt(c.h, CURLOPT_HTTPAUTH, (long)CURLAUTH_BASIC);
        curl_easy_setopt(c.h, CURLOPT_USERNAME, cfg_.username.c_str());
        curl_easy_setopt(c.h, CURLOPT_PASSWORD, cfg_.password.c_str());
    }

    trace_.line("GET " + url + " ...");
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw FetchError(url, errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(code)));
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    trace_.line("HTTP " + std::to_string(status) + ", " + std::to_string(buf.size()) + " bytes");
    if (status < 200 || status >= 300) {
        throw FetchError(url, "HTTP " + std::to_string(status));
    }
    return buf;
}
