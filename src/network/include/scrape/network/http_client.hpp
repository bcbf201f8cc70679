#pragma once

#include "scrape/core/types.hpp"
#include "scrape/core/string.hpp"
#include <memory>
#include <vector>

namespace scrape::network {

// ============================================================================
// HTTP Types
// ============================================================================

enum class HttpMethod {
    Get,
    Head,
};

[[nodiscard]] std::string_view http_method_to_string(HttpMethod method);

// ============================================================================
// HTTP Headers
// ============================================================================
//
// Names compare case-insensitively; insertion order is kept.

class HttpHeaders {
public:
    struct Entry {
        String name;
        String value;
    };

    // Replaces every header with this name
    void set(std::string_view name, std::string_view value);
    void add(std::string_view name, std::string_view value);
    void remove(std::string_view name);

    [[nodiscard]] std::optional<String> get(std::string_view name) const;
    [[nodiscard]] std::vector<String> get_all(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const;

    [[nodiscard]] usize size() const { return m_entries.size(); }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }

    [[nodiscard]] auto begin() const { return m_entries.begin(); }
    [[nodiscard]] auto end() const { return m_entries.end(); }

private:
    std::vector<Entry> m_entries;
};

// Parses one raw "Name: value\r\n" header line into `headers`. Status lines
// and blank lines are ignored.
void parse_header_line(std::string_view line, HttpHeaders& headers);

// ============================================================================
// HTTP Request / Response
// ============================================================================

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    String url;
    HttpHeaders headers;

    // Timeout in milliseconds (0 = the client's timeout)
    u32 timeout_ms{0};

    bool follow_redirects{true};
    u32 max_redirects{10};
};

struct HttpResponse {
    i32 status_code{0};
    HttpHeaders headers;
    std::vector<u8> body;

    // Final URL after redirects
    String url;

    f64 time_ms{0};

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool is_redirect() const { return status_code >= 300 && status_code < 400; }

    [[nodiscard]] String body_as_string() const;
};

// ============================================================================
// HTTP Client - libcurl easy interface
// ============================================================================
//
// One client owns one curl handle and must not be shared between threads
// while a request is in flight.

class HttpClient {
public:
    static constexpr u32 DEFAULT_TIMEOUT_MS = 30000;

    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Transport failures are errors; any HTTP status is a response
    [[nodiscard]] Result<HttpResponse, String> send(const HttpRequest& request);
    [[nodiscard]] Result<HttpResponse, String> get(std::string_view url);

    // Configuration
    void set_default_headers(const HttpHeaders& headers);
    void set_user_agent(std::string_view user_agent);
    void set_timeout(u32 timeout_ms);

    [[nodiscard]] const String& user_agent() const;
    [[nodiscard]] u32 timeout() const;

    // "scrape/<version>"
    [[nodiscard]] static String default_user_agent();

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace scrape::network
