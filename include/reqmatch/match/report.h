#pragma once
#include <reqmatch/core/diagnostics.h>
#include <reqmatch/http/request.h>
#include <reqmatch/match/matchers.h>
#include <optional>
#include <string>

namespace reqmatch::match {

// Multi-line explanation of why `request` failed `matchers`:
//   request [GET /] did not match 2 of 3 expectations
//     - expected Path("/a"), observed Path("/")
//     - ...
// Empty when the request matches.
std::string format_report(const Matchers& matchers, const http::Request& request);

// Records a failure trace for a mismatch in `collector` and returns a copy.
// Snapshots hold the rendered request and one expected/observed pair per
// failed rule; context comes from the emitter's match/validate events.
// Returns std::nullopt, recording nothing, when the request matches.
std::optional<core::FailureTrace> trace_mismatch(const Matchers& matchers,
                                                 const http::Request& request,
                                                 const core::DiagnosticEmitter& emitter,
                                                 core::FailureTraceCollector& collector);

} // namespace reqmatch::match
