#pragma once
#include <reqmatch/core/diagnostics.h>
#include <reqmatch/http/request.h>
#include <reqmatch/match/matcher.h>
#include <initializer_list>
#include <optional>
#include <vector>

namespace reqmatch::match {

// A failed rule paired with the state actually observed.
struct Mismatch {
    Matcher expected;
    Matcher observed;
};

// Ordered set of expectations evaluated together against one request.
// Rules are kept exactly in insertion order; nothing is merged or sorted.
class Matchers {
public:
    Matchers() = default;
    explicit Matchers(std::vector<Matcher> matchers);
    Matchers(std::initializer_list<Matcher> matchers);

    // Appends in place. Not synchronized; finish building before matching.
    void add(Matcher matcher);

    bool is_matched(const http::Request& request) const;

    // Every failed rule, in rule order. Empty when the request matches.
    std::vector<Mismatch> mismatches(const http::Request& request) const;

    // Every rule is evaluated, even after a failure. Returns the observed
    // state for each failed rule in rule order, or std::nullopt if all pass.
    std::optional<std::vector<Matcher>> validate(const http::Request& request) const;

    // Same result; also logs one Warning per failed rule, or one Info when
    // the request matched.
    std::optional<std::vector<Matcher>> validate(const http::Request& request,
                                                 core::DiagnosticEmitter& emitter) const;

    size_t size() const;
    bool empty() const;

    using iterator = std::vector<Matcher>::const_iterator;
    iterator begin() const;
    iterator end() const;

private:
    std::vector<Matcher> inner_;
};

} // namespace reqmatch::match
