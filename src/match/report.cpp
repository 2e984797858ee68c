#include <reqmatch/match/report.h>
#include <reqmatch/core/config.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace reqmatch::match {

namespace cfg = reqmatch::core::config;

namespace {

std::string summary(size_t failed, size_t total) {
    return "did not match " + std::to_string(failed) + " of " + std::to_string(total) +
           " expectations";
}

} // namespace

std::string format_report(const Matchers& matchers, const http::Request& request) {
    auto failures = matchers.mismatches(request);
    if (failures.empty()) {
        return {};
    }

    std::ostringstream oss;
    oss << "request " << request << " " << summary(failures.size(), matchers.size()) << "\n";
    for (const auto& f : failures) {
        oss << "  - expected " << f.expected << ", observed " << f.observed << "\n";
    }
    return oss.str();
}

std::optional<core::FailureTrace> trace_mismatch(const Matchers& matchers,
                                                 const http::Request& request,
                                                 const core::DiagnosticEmitter& emitter,
                                                 core::FailureTraceCollector& collector) {
    auto failures = matchers.mismatches(request);
    if (failures.empty()) {
        return std::nullopt;
    }

    std::vector<core::FailureSnapshot> snapshots;
    snapshots.push_back({"request", request.to_string()});
    for (size_t i = 0; i < failures.size(); ++i) {
        const std::string index = "[" + std::to_string(i) + "]";
        snapshots.push_back({"expected" + index, failures[i].expected.to_string()});
        snapshots.push_back({"observed" + index, failures[i].observed.to_string()});
    }
    return collector.capture(emitter, cfg::kMatchModule, cfg::kValidateStage,
                             summary(failures.size(), matchers.size()), std::move(snapshots));
}

} // namespace reqmatch::match
