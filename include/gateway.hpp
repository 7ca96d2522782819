#ifndef DTMFDEC_NODE_GATEWAY_HPP
#define DTMFDEC_NODE_GATEWAY_HPP

#include <string>
#include <string_view>

namespace dtmfdec::node {

/// Configuration for the HTTP gateway used by remote commands.
struct GatewayConfig {
    std::string joke_url     = "https://v2.jokeapi.dev/joke/Programming?type=single";
    std::string activity_url = "https://www.boredapi.com/api/activity";
    long        timeout_sec  = 10;
};

/// libcurl-backed HTTP client for commands that fetch remote content.
class Gateway {
public:
    Gateway();
    ~Gateway();

    /// Initialise libcurl and store config.
    bool open(const GatewayConfig& cfg);

    /// Clean up.
    void close();

    /// GET `url`. Returns the body on HTTP 200, or an empty string.
    std::string fetch(const std::string& url);

    /// Fetch a programming joke; empty on failure.
    std::string joke();

    /// Fetch a suggested activity; empty on failure.
    std::string activity();

    /// Minimal JSON lookup of a top-level "field":"value" string.
    /// Handles \" and \\ escapes; returns empty if absent.
    static std::string extract_string_field(std::string_view json,
                                            std::string_view field);

    const GatewayConfig& config() const noexcept { return cfg_; }

private:
    GatewayConfig cfg_;
    bool          initialized_ = false;
};

} // namespace dtmfdec::node

#endif // DTMFDEC_NODE_GATEWAY_HPP
