#include <reqmatch/http/request.h>
#include <reqmatch/core/config.h>

#include <cctype>
#include <sstream>
#include <utility>

namespace reqmatch::http {

namespace cfg = reqmatch::core::config;

namespace {

std::string_view trim(std::string_view input) {
    size_t start = 0;
    while (start < input.size() &&
           std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    size_t end = input.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return input.substr(start, end - start);
}

// Split once on the first `delimiter`. An empty right-hand side, or no
// delimiter at all, yields std::nullopt for the second half.
std::pair<std::string_view, std::optional<std::string_view>>
split_once(std::string_view input, char delimiter) {
    const size_t pos = input.find(delimiter);
    if (pos == std::string_view::npos) {
        return {input, std::nullopt};
    }
    std::string_view rest = input.substr(pos + 1);
    if (rest.empty()) {
        return {input.substr(0, pos), std::nullopt};
    }
    return {input.substr(0, pos), rest};
}

// Later duplicates overwrite earlier ones.
void parse_query(std::string_view query, QueryMap& out) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t next = query.find(cfg::kPairSeparator, pos);
        if (next == std::string_view::npos) next = query.size();

        auto [key, value] = split_once(query.substr(pos, next - pos), cfg::kKeyValueSeparator);
        if (value) {
            out[std::string(key)] = std::string(*value);
        } else {
            out[std::string(key)] = std::nullopt;
        }

        pos = next + 1;
    }
}

} // namespace

Request parse_request(std::string_view text) {
    std::string_view input = trim(text);
    if (!input.empty() && input.front() == cfg::kPathSeparator) {
        input.remove_prefix(1);
    }

    auto [before_fragment, fragment] = split_once(input, cfg::kFragmentDelimiter);
    auto [path, query] = split_once(before_fragment, cfg::kQueryDelimiter);

    Request request;
    request.path = cfg::kPathSeparator + std::string(path);
    if (fragment) {
        request.fragment = std::string(*fragment);
    }
    if (query) {
        parse_query(*query, request.query);
    }
    return request;
}

Request Request::from(std::string_view text) {
    return parse_request(text);
}

void Request::set_method(std::string value) {
    method = std::move(value);
}

void Request::set_path(std::string value) {
    if (value.empty() || value.front() != cfg::kPathSeparator) {
        value.insert(value.begin(), cfg::kPathSeparator);
    }
    path = std::move(value);
}

void Request::set_query(std::string key, std::optional<std::string> value) {
    query[std::move(key)] = std::move(value);
}

void Request::set_fragment(std::optional<std::string> value) {
    if (value && value->empty()) {
        value.reset();
    }
    fragment = std::move(value);
}

void Request::set_header(const std::string& name, const std::string& value) {
    headers.set(name, value);
}

void Request::set_body(std::optional<std::string> value) {
    body = std::move(value);
}

Request Request::with_method(std::string value) const {
    Request copy = *this;
    copy.set_method(std::move(value));
    return copy;
}

Request Request::with_path(std::string value) const {
    Request copy = *this;
    copy.set_path(std::move(value));
    return copy;
}

Request Request::with_query(std::string key, std::optional<std::string> value) const {
    Request copy = *this;
    copy.set_query(std::move(key), std::move(value));
    return copy;
}

Request Request::with_fragment(std::string value) const {
    Request copy = *this;
    copy.set_fragment(std::move(value));
    return copy;
}

Request Request::with_header(const std::string& name, const std::string& value) const {
    Request copy = *this;
    copy.set_header(name, value);
    return copy;
}

Request Request::with_body(std::string value) const {
    Request copy = *this;
    copy.set_body(std::move(value));
    return copy;
}

std::string Request::to_string() const {
    std::ostringstream oss;
    oss << "[" << method << " " << path;

    if (!query.empty()) {
        oss << cfg::kQueryDelimiter;
        bool first = true;
        for (const auto& [key, value] : query) {
            if (!first) oss << cfg::kPairSeparator;
            first = false;
            oss << key;
            if (value) {
                oss << cfg::kKeyValueSeparator << *value;
            }
        }
    }

    if (fragment) {
        oss << cfg::kFragmentDelimiter << *fragment;
    }

    if (!headers.empty()) {
        oss << cfg::kHeadersSection << "{";
        bool first = true;
        for (const auto& [name, value] : headers) {
            if (!first) oss << ", ";
            first = false;
            oss << "\"" << name << "\" = \"" << value << "\"";
        }
        oss << "}";
    }

    if (body) {
        oss << cfg::kBodySection << "\"" << *body << "\"";
    }

    oss << "]";
    return oss.str();
}

bool Request::operator==(const Request& other) const {
    return method == other.method && path == other.path &&
           query == other.query && fragment == other.fragment &&
           headers == other.headers && body == other.body;
}

bool Request::operator!=(const Request& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Request& request) {
    return os << request.to_string();
}

} // namespace reqmatch::http
