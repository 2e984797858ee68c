#pragma once
#include <reqmatch/http/request.h>
#include <optional>
#include <ostream>
#include <string>

namespace reqmatch::match {

// A single expectation about a request. The same type describes what was
// actually observed when an expectation fails, so a returned diagnostic can
// be used directly as a corrected expectation.
class Matcher {
public:
    enum class Kind {
        Method,
        Path,
        QueryExists,
        QueryMiss,
        QueryEq,
        FragmentEq,
        FragmentMiss,
        HeaderExists,
        HeaderMiss,
        HeaderEq,
        BodyMiss,
        BodyEq,
    };

    static Matcher method(std::string expected);
    static Matcher path(std::string expected);
    static Matcher query_exists(std::string key);
    static Matcher query_miss(std::string key);
    static Matcher query_eq(std::string key, std::string expected);
    static Matcher fragment_eq(std::string expected);
    static Matcher fragment_miss();
    static Matcher header_exists(std::string key);
    static Matcher header_miss(std::string key);
    static Matcher header_eq(std::string key, std::string expected);
    static Matcher body_miss();
    static Matcher body_eq(std::string expected);

    Kind kind() const { return kind_; }
    // Query or header name; empty for the other kinds.
    const std::string& key() const { return key_; }
    // Expected (or observed) value; empty for existence kinds.
    const std::string& value() const { return value_; }

    // std::nullopt when `request` satisfies this expectation, otherwise the
    // state actually observed, expressed as another Matcher.
    std::optional<Matcher> validate(const http::Request& request) const;

    // e.g. Method("GET"), QueryEq("key", "value"), FragmentMiss
    std::string to_string() const;

    bool operator==(const Matcher& other) const;
    bool operator!=(const Matcher& other) const;

private:
    Matcher(Kind kind, std::string key, std::string value);

    Kind kind_;
    std::string key_;
    std::string value_;
};

const char* kind_name(Matcher::Kind kind);

std::ostream& operator<<(std::ostream& os, const Matcher& matcher);

// Shorthands for building expectation lists
Matcher method(std::string expected);
Matcher path(std::string expected);
Matcher query_exists(std::string key);
Matcher query_miss(std::string key);
Matcher query_eq(std::string key, std::string expected);
Matcher fragment_eq(std::string expected);
Matcher fragment_miss();
Matcher header_exists(std::string key);
Matcher header_miss(std::string key);
Matcher header_eq(std::string key, std::string expected);
Matcher body_miss();
Matcher body_eq(std::string expected);

} // namespace reqmatch::match
