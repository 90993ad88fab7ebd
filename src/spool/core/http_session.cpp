// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <map>

namespace spool::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// Everything the curl callbacks need for one transfer
struct Transfer {
    FetchHandlers& handlers;
    std::map<std::string, std::string> headers;
    std::int32_t status{0};
    bool response_delivered{false};
    std::error_code response_error;  // Set when on_response refused the response
    bool aborted{false};
};

// Header callback: one call per header line, a new status line per redirect hop
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* t = static_cast<Transfer*>(userdata);
    if (!t) return total;

    std::string_view line(buffer, total);
    if (line.starts_with("HTTP/")) {
        t->headers.clear();
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto code = parse_u64(line.substr(sp + 1, 3));
            t->status = code ? static_cast<std::int32_t>(*code) : 0;
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = line.substr(0, colon);
    auto value = trim(line.substr(colon + 1));

    // Convert name to lowercase
    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    t->headers[lower_name] = std::string(value);
    return total;
}

OriginResponse build_response(const Transfer& t) {
    OriginResponse r;
    r.status = t.status;

    auto header = [&t](const char* name) -> const std::string* {
        auto it = t.headers.find(name);
        return it == t.headers.end() ? nullptr : &it->second;
    };

    std::optional<std::uint64_t> content_length;
    if (auto* cl = header("content-length")) {
        content_length = parse_u64(*cl);
    }

    if (t.status == 206) {
        if (auto* cr = header("content-range")) {
            if (auto range = parse_content_range(*cr)) {
                r.range_start = range->start;
                r.total_length = range->total;
                r.body_length = range->length();
            }
        }
        if (!r.body_length) {
            r.body_length = content_length;
        }
        r.accepts_ranges = true;
    } else {
        r.total_length = content_length;
        r.body_length = content_length;
    }

    if (auto* ct = header("content-type"); ct && !ct->empty()) {
        r.content_type = *ct;
    }
    if (auto* ar = header("accept-ranges"); ar && ar->find("bytes") != std::string::npos) {
        r.accepts_ranges = true;
    }
    return r;
}

// Deliver on_response once; false if the handler refused it
bool deliver_response(Transfer& t) {
    if (t.response_delivered) return !t.response_error;
    t.response_delivered = true;

    t.response_error = t.handlers.on_response(build_response(t));
    return !t.response_error;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* t = static_cast<Transfer*>(userdata);
    std::size_t bytes = size * nmemb;

    try {
        if (!deliver_response(*t)) {
            return 0;  // Aborts with CURLE_WRITE_ERROR
        }
        if (!t->handlers.on_data({reinterpret_cast<const std::byte*>(ptr), bytes})) {
            t->aborted = true;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("response handler threw: {}", e.what());
        t->aborted = true;
        return 0;
    }
    return bytes;
}

// libcurl progress callback - polls the stop flag and aborts if set
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* t = static_cast<Transfer*>(userdata);
    if (t->handlers.should_stop()) {
        t->aborted = true;
        return 1;
    }
    return 0;
}

std::error_code map_http_status(long http_code) noexcept {
    if (http_code == 416) return make_error_code(CacheErrc::invalid_range);
    if (http_code == 404 || http_code == 410) return make_error_code(CacheErrc::not_found);
    if (http_code >= 500) return make_error_code(CacheErrc::server_error);
    return make_error_code(CacheErrc::network_error);
}

std::error_code map_curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OPERATION_TIMEDOUT:     return make_error_code(CacheErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:  return make_error_code(CacheErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:             return make_error_code(CacheErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:     return make_error_code(CacheErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:   return make_error_code(CacheErrc::invalid_url);
        default:                           return make_error_code(CacheErrc::network_error);
    }
}

} // namespace

std::optional<ContentRange> parse_content_range(std::string_view value) noexcept {
    value = trim(value);

    constexpr std::string_view UNIT = "bytes";
    if (value.size() <= UNIT.size()) return std::nullopt;
    for (std::size_t i = 0; i < UNIT.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != UNIT[i]) return std::nullopt;
    }
    value = trim(value.substr(UNIT.size()));

    auto slash = value.find('/');
    if (slash == std::string_view::npos) return std::nullopt;
    auto span = value.substr(0, slash);
    auto total = trim(value.substr(slash + 1));

    auto dash = span.find('-');
    if (dash == std::string_view::npos) return std::nullopt;  // Also rejects "*/total"

    auto start = parse_u64(span.substr(0, dash));
    auto end = parse_u64(span.substr(dash + 1));
    if (!start || !end || *end < *start) return std::nullopt;

    ContentRange range{*start, *end, std::nullopt};
    if (total != "*") {
        range.total = parse_u64(total);
        if (!range.total || range.end >= *range.total) return std::nullopt;
    }
    return range;
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

std::error_code HttpSession::fetch(std::string_view url, std::uint64_t start,
                                   std::optional<std::uint64_t> end_inclusive,
                                   FetchHandlers& handlers) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return make_error_code(CacheErrc::network_error);
        }

        Transfer transfer{handlers};

        std::string url_str(url);
        curl_easy_setopt(curl.ptr, CURLOPT_URL, url_str.c_str());

        std::string range = std::to_string(start) + "-";
        if (end_inclusive) {
            range += std::to_string(*end_inclusive);
        }
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());

        // HTTP errors become CURLE_HTTP_RETURNED_ERROR without a body
        curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);

        // Set callbacks
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);  // Enable progress callback

        // Timeouts
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);

        // SSL options
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

        // Follow redirects
        if constexpr (FOLLOW_REDIRECTS) {
            curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
        }

        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(RECEIVE_BUFFER_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent_.c_str());

        spdlog::debug("GET {} bytes={}", url_str, range);
        CURLcode result = curl_easy_perform(curl.ptr);

        if (transfer.response_error) {
            return transfer.response_error;
        }
        if (transfer.aborted) {
            return make_error_code(CacheErrc::cancelled);
        }

        if (result == CURLE_HTTP_RETURNED_ERROR) {
            long http_code = 0;
            curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
            spdlog::debug("GET {} failed with HTTP {}", url_str, http_code);
            return map_http_status(http_code);
        }
        if (result != CURLE_OK) {
            spdlog::debug("GET {} failed: {}", url_str, curl_easy_strerror(result));
            return map_curl_error(result);
        }

        // Empty body: the write callback never ran
        if (!deliver_response(transfer)) {
            return transfer.response_error;
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("GET {} failed: {}", url, e.what());
        return make_error_code(CacheErrc::network_error);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace spool::core
