#include "link.hpp"
#include <core/constants.hpp>
#include <boost/url.hpp>
#include <fmt/format.h>

namespace urls = boost::urls;

// Ports a URL leaves implicit for its scheme. Writing one out explicitly
// still counts as no port.
static uint16_t default_port(urls::scheme id) {
    switch (id) {
        case urls::scheme::ftp:   return 21;
        case urls::scheme::http:
        case urls::scheme::ws:    return 80;
        case urls::scheme::https:
        case urls::scheme::wss:   return 443;
        default:                  return 0;
    }
}

Result<LinkParts> parse_link(const std::string& link) {
    const std::string malformed = fmt::format("Failed to parse Jupyter URL '{}'.", link);
    const std::string no_port = "Incorrect Jupyter link format: no port in URL.";

    auto parsed = urls::parse_uri(link);
    if (!parsed) {
        return Result<LinkParts>::Err(malformed);
    }
    const auto& url = parsed.value();

    // "mailto:x" style links parse but carry no host or port
    if (!url.has_authority()) {
        return Result<LinkParts>::Err(no_port);
    }
    if (url.encoded_host().empty()) {
        return Result<LinkParts>::Err(malformed);
    }

    // "host:" with nothing after it is a URL with the default port
    if (!url.has_port() || url.port().empty()) {
        return Result<LinkParts>::Err(no_port);
    }
    uint16_t port = url.port_number();
    if (port < MIN_PORT) {
        // Zero, or too large for 16 bits
        return Result<LinkParts>::Err(malformed);
    }
    if (port == default_port(url.scheme_id())) {
        return Result<LinkParts>::Err(no_port);
    }

    // First `token` parameter wins; '+' decodes to a space
    auto params = url.params(urls::encoding_opts(true, false, false));
    auto it = params.find("token");
    if (it == params.end()) {
        return Result<LinkParts>::Err(
            "Incorrect Jupyter link format: cannot determine authentication token.");
    }

    LinkParts parts;
    parts.port = port;
    parts.token = (*it).value;
    return Result<LinkParts>::Ok(parts);
}
