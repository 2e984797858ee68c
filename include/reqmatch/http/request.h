#pragma once
#include <reqmatch/core/config.h>
#include <reqmatch/http/header_map.h>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace reqmatch::http {

// Query parameters. A key given without "=value" maps to std::nullopt,
// which is distinct from the key being absent.
using QueryMap = std::map<std::string, std::optional<std::string>>;

struct Request {
    std::string method = core::config::kDefaultMethod;
    std::string path = core::config::kRootPath;
    QueryMap query;
    std::optional<std::string> fragment;
    HeaderMap headers;
    std::optional<std::string> body;

    // Parse URI-like text: ['/'] [path] ['?' key['=' value] ('&' ...)*] ['#' fragment]
    static Request from(std::string_view text);

    // In-place setters; each touches exactly one field
    void set_method(std::string value);
    void set_path(std::string value);
    void set_query(std::string key, std::optional<std::string> value = std::nullopt);
    void set_fragment(std::optional<std::string> value);
    void set_header(const std::string& name, const std::string& value);
    void set_body(std::optional<std::string> value);

    // Copying builders for chained construction
    Request with_method(std::string value) const;
    Request with_path(std::string value) const;
    Request with_query(std::string key, std::optional<std::string> value = std::nullopt) const;
    Request with_fragment(std::string value) const;
    Request with_header(const std::string& name, const std::string& value) const;
    Request with_body(std::string value) const;

    // Single-line form:
    // [METHOD PATH[?query][#fragment][ | with headers {...}][ | with body "..."]]
    std::string to_string() const;

    bool operator==(const Request& other) const;
    bool operator!=(const Request& other) const;
};

Request parse_request(std::string_view text);

std::ostream& operator<<(std::ostream& os, const Request& request);

} // namespace reqmatch::http
