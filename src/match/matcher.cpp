#include <reqmatch/match/matcher.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace reqmatch::match {

namespace {

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::toupper(x) == std::toupper(y);
           });
}

std::optional<Matcher> validate_query_eq(const http::Request& request,
                                         const std::string& key,
                                         const std::string& expected) {
    auto it = request.query.find(key);
    if (it == request.query.end()) {
        return Matcher::query_miss(key);
    }
    const auto& actual = it->second;
    if (!actual) {
        return Matcher::query_exists(key);
    }
    if (*actual != expected) {
        return Matcher::query_eq(key, *actual);
    }
    return std::nullopt;
}

std::optional<Matcher> validate_header_eq(const http::Request& request,
                                          const std::string& key,
                                          const std::string& expected) {
    auto it = request.headers.find(key);
    if (it == request.headers.end()) {
        return Matcher::header_miss(key);
    }
    if (it->second != expected) {
        return Matcher::header_eq(key, it->second);
    }
    return std::nullopt;
}

} // namespace

Matcher::Matcher(Kind kind, std::string key, std::string value)
    : kind_(kind), key_(std::move(key)), value_(std::move(value)) {}

Matcher Matcher::method(std::string expected) {
    return Matcher(Kind::Method, {}, std::move(expected));
}

Matcher Matcher::path(std::string expected) {
    return Matcher(Kind::Path, {}, std::move(expected));
}

Matcher Matcher::query_exists(std::string key) {
    return Matcher(Kind::QueryExists, std::move(key), {});
}

Matcher Matcher::query_miss(std::string key) {
    return Matcher(Kind::QueryMiss, std::move(key), {});
}

Matcher Matcher::query_eq(std::string key, std::string expected) {
    return Matcher(Kind::QueryEq, std::move(key), std::move(expected));
}

Matcher Matcher::fragment_eq(std::string expected) {
    return Matcher(Kind::FragmentEq, {}, std::move(expected));
}

Matcher Matcher::fragment_miss() {
    return Matcher(Kind::FragmentMiss, {}, {});
}

Matcher Matcher::header_exists(std::string key) {
    return Matcher(Kind::HeaderExists, std::move(key), {});
}

Matcher Matcher::header_miss(std::string key) {
    return Matcher(Kind::HeaderMiss, std::move(key), {});
}

Matcher Matcher::header_eq(std::string key, std::string expected) {
    return Matcher(Kind::HeaderEq, std::move(key), std::move(expected));
}

Matcher Matcher::body_miss() {
    return Matcher(Kind::BodyMiss, {}, {});
}

Matcher Matcher::body_eq(std::string expected) {
    return Matcher(Kind::BodyEq, {}, std::move(expected));
}

std::optional<Matcher> Matcher::validate(const http::Request& request) const {
    switch (kind_) {
        case Kind::Method:
            // Case-insensitive match, but report the method exactly as sent
            if (!equals_ignore_case(request.method, value_)) {
                return Matcher::method(request.method);
            }
            return std::nullopt;

        case Kind::Path:
            if (request.path != value_) {
                return Matcher::path(request.path);
            }
            return std::nullopt;

        case Kind::QueryEq:
            return validate_query_eq(request, key_, value_);

        case Kind::QueryExists:
            if (request.query.find(key_) == request.query.end()) {
                return Matcher::query_miss(key_);
            }
            return std::nullopt;

        case Kind::QueryMiss:
            if (request.query.find(key_) != request.query.end()) {
                return Matcher::query_exists(key_);
            }
            return std::nullopt;

        case Kind::HeaderEq:
            return validate_header_eq(request, key_, value_);

        case Kind::HeaderExists:
            if (!request.headers.has(key_)) {
                return Matcher::header_miss(key_);
            }
            return std::nullopt;

        case Kind::HeaderMiss:
            if (request.headers.has(key_)) {
                return Matcher::header_exists(key_);
            }
            return std::nullopt;

        case Kind::FragmentEq:
            if (!request.fragment) {
                return Matcher::fragment_miss();
            }
            if (*request.fragment != value_) {
                return Matcher::fragment_eq(*request.fragment);
            }
            return std::nullopt;

        case Kind::FragmentMiss:
            if (request.fragment) {
                return Matcher::fragment_eq(*request.fragment);
            }
            return std::nullopt;

        case Kind::BodyEq:
            if (!request.body) {
                return Matcher::body_miss();
            }
            if (*request.body != value_) {
                return Matcher::body_eq(*request.body);
            }
            return std::nullopt;

        case Kind::BodyMiss:
            if (request.body) {
                return Matcher::body_eq(*request.body);
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::string Matcher::to_string() const {
    std::ostringstream oss;
    oss << kind_name(kind_);
    switch (kind_) {
        case Kind::Method:
        case Kind::Path:
        case Kind::FragmentEq:
        case Kind::BodyEq:
            oss << "(\"" << value_ << "\")";
            break;
        case Kind::QueryExists:
        case Kind::QueryMiss:
        case Kind::HeaderExists:
        case Kind::HeaderMiss:
            oss << "(\"" << key_ << "\")";
            break;
        case Kind::QueryEq:
        case Kind::HeaderEq:
            oss << "(\"" << key_ << "\", \"" << value_ << "\")";
            break;
        case Kind::FragmentMiss:
        case Kind::BodyMiss:
            break;
    }
    return oss.str();
}

bool Matcher::operator==(const Matcher& other) const {
    return kind_ == other.kind_ && key_ == other.key_ && value_ == other.value_;
}

bool Matcher::operator!=(const Matcher& other) const {
    return !(*this == other);
}

const char* kind_name(Matcher::Kind kind) {
    switch (kind) {
        case Matcher::Kind::Method:       return "Method";
        case Matcher::Kind::Path:         return "Path";
        case Matcher::Kind::QueryExists:  return "QueryExists";
        case Matcher::Kind::QueryMiss:    return "QueryMiss";
        case Matcher::Kind::QueryEq:      return "QueryEq";
        case Matcher::Kind::FragmentEq:   return "FragmentEq";
        case Matcher::Kind::FragmentMiss: return "FragmentMiss";
        case Matcher::Kind::HeaderExists: return "HeaderExists";
        case Matcher::Kind::HeaderMiss:   return "HeaderMiss";
        case Matcher::Kind::HeaderEq:     return "HeaderEq";
        case Matcher::Kind::BodyMiss:     return "BodyMiss";
        case Matcher::Kind::BodyEq:       return "BodyEq";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const Matcher& matcher) {
    return os << matcher.to_string();
}

Matcher method(std::string expected) { return Matcher::method(std::move(expected)); }
Matcher path(std::string expected) { return Matcher::path(std::move(expected)); }
Matcher query_exists(std::string key) { return Matcher::query_exists(std::move(key)); }
Matcher query_miss(std::string key) { return Matcher::query_miss(std::move(key)); }
Matcher query_eq(std::string key, std::string expected) {
    return Matcher::query_eq(std::move(key), std::move(expected));
}
Matcher fragment_eq(std::string expected) { return Matcher::fragment_eq(std::move(expected)); }
Matcher fragment_miss() { return Matcher::fragment_miss(); }
Matcher header_exists(std::string key) { return Matcher::header_exists(std::move(key)); }
Matcher header_miss(std::string key) { return Matcher::header_miss(std::move(key)); }
Matcher header_eq(std::string key, std::string expected) {
    return Matcher::header_eq(std::move(key), std::move(expected));
}
Matcher body_miss() { return Matcher::body_miss(); }
Matcher body_eq(std::string expected) { return Matcher::body_eq(std::move(expected)); }

} // namespace reqmatch::match
