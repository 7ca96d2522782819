#include "gateway.hpp"

#include <cstdio>

#include <curl/curl.h>

namespace dtmfdec::node {

// ---------------------------------------------------------------------------
// curl write callback
// ---------------------------------------------------------------------------
static std::size_t write_cb(char* ptr, std::size_t size, std::size_t nmemb,
                            void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Gateway::Gateway() = default;

Gateway::~Gateway() { close(); }

bool Gateway::open(const GatewayConfig& cfg) {
    cfg_ = cfg;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::fprintf(stderr, "[gateway] curl_global_init failed\n");
        return false;
    }
    initialized_ = true;
    return true;
}

void Gateway::close() {
    if (initialized_) {
        curl_global_cleanup();
        initialized_ = false;
    }
}

// ---------------------------------------------------------------------------
// HTTP
// ---------------------------------------------------------------------------

std::string Gateway::fetch(const std::string& url) {
    if (!initialized_) return {};

    CURL* curl = curl_easy_init();
    if (!curl) return {};

    std::string response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, cfg_.timeout_sec);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::fprintf(stderr, "[gateway] GET %s failed: %s\n",
                     url.c_str(), curl_easy_strerror(res));
        return {};
    }
    if (http_code != 200) {
        std::fprintf(stderr, "[gateway] GET %s returned HTTP %ld\n",
                     url.c_str(), http_code);
        return {};
    }
    return response;
}

std::string Gateway::joke() {
    return extract_string_field(fetch(cfg_.joke_url), "joke");
}

std::string Gateway::activity() {
    return extract_string_field(fetch(cfg_.activity_url), "activity");
}

// ---------------------------------------------------------------------------
// Minimal JSON parse: look for "field":"<value>"
// ---------------------------------------------------------------------------

std::string Gateway::extract_string_field(std::string_view json,
                                          std::string_view field) {
    std::string key = "\"";
    key.append(field);
    key += '"';

    auto pos = json.find(key);
    if (pos == std::string_view::npos) return {};
    pos += key.size();

    // Skip whitespace and the colon.
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == ':' ||
                                 json[pos] == '\t' || json[pos] == '\n' ||
                                 json[pos] == '\r')) {
        ++pos;
    }
    if (pos >= json.size() || json[pos] != '"') return {};
    ++pos;

    std::string value;
    for (; pos < json.size(); ++pos) {
        char c = json[pos];
        if (c == '"') return value;
        if (c == '\\' && pos + 1 < json.size()) {
            char next = json[++pos];
            switch (next) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default:  value += next; break;
            }
            continue;
        }
        value += c;
    }
    return {}; // unterminated string
}

} // namespace dtmfdec::node
