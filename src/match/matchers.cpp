#include <reqmatch/match/matchers.h>
#include <reqmatch/core/config.h>

#include <algorithm>
#include <string>
#include <utility>

namespace reqmatch::match {

namespace cfg = reqmatch::core::config;

Matchers::Matchers(std::vector<Matcher> matchers) : inner_(std::move(matchers)) {}

Matchers::Matchers(std::initializer_list<Matcher> matchers) : inner_(matchers) {}

void Matchers::add(Matcher matcher) {
    inner_.push_back(std::move(matcher));
}

bool Matchers::is_matched(const http::Request& request) const {
    return std::all_of(inner_.begin(), inner_.end(), [&request](const Matcher& m) {
        return !m.validate(request).has_value();
    });
}

std::vector<Mismatch> Matchers::mismatches(const http::Request& request) const {
    std::vector<Mismatch> result;
    for (const auto& matcher : inner_) {
        if (auto actual = matcher.validate(request)) {
            result.push_back({matcher, std::move(*actual)});
        }
    }
    return result;
}

std::optional<std::vector<Matcher>> Matchers::validate(const http::Request& request) const {
    auto failed = mismatches(request);
    if (failed.empty()) {
        return std::nullopt;
    }
    std::vector<Matcher> errors;
    errors.reserve(failed.size());
    for (auto& m : failed) {
        errors.push_back(std::move(m.observed));
    }
    return errors;
}

std::optional<std::vector<Matcher>> Matchers::validate(const http::Request& request,
                                                       core::DiagnosticEmitter& emitter) const {
    const std::string subject = request.to_string();
    auto failed = mismatches(request);
    if (failed.empty()) {
        emitter.emit(core::Severity::Info, cfg::kMatchModule, cfg::kValidateStage,
                     "matched " + std::to_string(inner_.size()) + " expectations", subject);
        return std::nullopt;
    }
    std::vector<Matcher> errors;
    errors.reserve(failed.size());
    for (auto& m : failed) {
        emitter.emit(core::Severity::Warning, cfg::kMatchModule, cfg::kValidateStage,
                     "expected " + m.expected.to_string() + " but observed " +
                         m.observed.to_string(),
                     subject);
        errors.push_back(std::move(m.observed));
    }
    return errors;
}

size_t Matchers::size() const {
    return inner_.size();
}

bool Matchers::empty() const {
    return inner_.empty();
}

Matchers::iterator Matchers::begin() const {
    return inner_.begin();
}

Matchers::iterator Matchers::end() const {
    return inner_.end();
}

} // namespace reqmatch::match
