/**
 * HTTP Client implementation
 */

#include "scrape/network/http_client.hpp"
#include "scrape/core/logger.hpp"
#include <curl/curl.h>
#include <format>
#include <mutex>

#ifndef SCRAPE_VERSION
#define SCRAPE_VERSION "0.0.0"
#endif

namespace scrape::network {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("network");
    return instance;
}

std::string_view trim_http_whitespace(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'
                             || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

bool name_equals(const String& name, std::string_view other) {
    return name.equals_ignore_case(other);
}

} // namespace

// ============================================================================
// HTTP Method conversion
// ============================================================================

std::string_view http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Head: return "HEAD";
    }
    return "GET";
}

// ============================================================================
// HttpHeaders implementation
// ============================================================================

void HttpHeaders::set(std::string_view name, std::string_view value) {
    remove(name);
    add(name, value);
}

void HttpHeaders::add(std::string_view name, std::string_view value) {
    m_entries.push_back(Entry{String(name), String(value)});
}

void HttpHeaders::remove(std::string_view name) {
    std::erase_if(m_entries, [&](const Entry& entry) { return name_equals(entry.name, name); });
}

std::optional<String> HttpHeaders::get(std::string_view name) const {
    for (const auto& entry : m_entries) {
        if (name_equals(entry.name, name)) {
            return entry.value;
        }
    }
    return std::nullopt;
}

std::vector<String> HttpHeaders::get_all(std::string_view name) const {
    std::vector<String> values;
    for (const auto& entry : m_entries) {
        if (name_equals(entry.name, name)) {
            values.push_back(entry.value);
        }
    }
    return values;
}

bool HttpHeaders::has(std::string_view name) const {
    return get(name).has_value();
}

void parse_header_line(std::string_view line, HttpHeaders& headers) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return;
    }
    auto name = trim_http_whitespace(line.substr(0, colon));
    if (name.empty() || name.starts_with("HTTP/")) {
        return;
    }
    headers.add(name, trim_http_whitespace(line.substr(colon + 1)));
}

// ============================================================================
// HttpResponse implementation
// ============================================================================

String HttpResponse::body_as_string() const {
    return String(reinterpret_cast<const char*>(body.data()), body.size());
}

// ============================================================================
// HttpClient implementation
// ============================================================================

struct HttpClient::Impl {
    CURL* curl{nullptr};
    HttpHeaders default_headers;
    String user_agent{HttpClient::default_user_agent()};
    u32 timeout_ms{HttpClient::DEFAULT_TIMEOUT_MS};

    Impl() {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        curl = curl_easy_init();
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<u8>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* response = static_cast<HttpResponse*>(userdata);
    size_t total = size * nitems;
    std::string_view line(buffer, total);

    // A new status line starts the headers of a redirected response
    if (line.starts_with("HTTP/")) {
        response->headers = HttpHeaders();
        return total;
    }
    parse_header_line(line, response->headers);
    return total;
}

// Frees the header list on every return path
struct HeaderList {
    curl_slist* list{nullptr};

    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }

    void append(const HttpHeaders::Entry& entry) {
        auto header = std::format("{}: {}", entry.name.view(), entry.value.view());
        list = curl_slist_append(list, header.c_str());
    }
};

} // namespace

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {}

HttpClient::~HttpClient() = default;

String HttpClient::default_user_agent() {
    return String("scrape/" SCRAPE_VERSION);
}

Result<HttpResponse, String> HttpClient::send(const HttpRequest& request) {
    if (!m_impl->curl) {
        return make_error(String("curl could not be initialized"));
    }

    CURL* curl = m_impl->curl;
    HttpResponse response;
    response.url = request.url;

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Head:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
    }

    HeaderList headers;
    for (const auto& entry : m_impl->default_headers) {
        if (!request.headers.has(entry.name.view())) {
            headers.append(entry);
        }
    }
    for (const auto& entry : request.headers) {
        headers.append(entry);
    }
    if (headers.list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);

    u32 timeout = request.timeout_ms > 0 ? request.timeout_ms : m_impl->timeout_ms;
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_impl->user_agent.c_str());
    // Accept any encoding curl can decode
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (request.follow_redirects) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));
    }

    logger().debug_fmt("{} {}", http_method_to_string(request.method), request.url.view());
    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        logger().debug_fmt("request to {} failed: {}", request.url.view(), curl_easy_strerror(code));
        return make_error(String(curl_easy_strerror(code)));
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = static_cast<i32>(status_code);

    double total_time = 0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);
    response.time_ms = total_time * 1000.0;

    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url) {
        response.url = String(effective_url);
    }

    logger().debug_fmt("{} {} ({} bytes, {:.1f} ms)", response.status_code, response.url.view(),
                       response.body.size(), response.time_ms);
    return response;
}

Result<HttpResponse, String> HttpClient::get(std::string_view url) {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = String(url);
    return send(request);
}

void HttpClient::set_default_headers(const HttpHeaders& headers) {
    m_impl->default_headers = headers;
}

void HttpClient::set_user_agent(std::string_view user_agent) {
    m_impl->user_agent = String(user_agent);
}

void HttpClient::set_timeout(u32 timeout_ms) {
    m_impl->timeout_ms = timeout_ms;
}

const String& HttpClient::user_agent() const {
    return m_impl->user_agent;
}

u32 HttpClient::timeout() const {
    return m_impl->timeout_ms;
}

} // namespace scrape::network
