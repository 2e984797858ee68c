#ifndef REQMATCH_CORE_CONFIG_H
#define REQMATCH_CORE_CONFIG_H

namespace reqmatch::core::config {

inline constexpr const char kDefaultMethod[] = "GET";
inline constexpr const char kRootPath[] = "/";

// URI-like request text delimiters
inline constexpr char kPathSeparator = '/';
inline constexpr char kQueryDelimiter = '?';
inline constexpr char kFragmentDelimiter = '#';
inline constexpr char kPairSeparator = '&';
inline constexpr char kKeyValueSeparator = '=';

// Request rendering
inline constexpr const char kHeadersSection[] = " | with headers ";
inline constexpr const char kBodySection[] = " | with body ";

// Diagnostics module names
inline constexpr const char kMatchModule[] = "match";
inline constexpr const char kValidateStage[] = "validate";

}  // namespace reqmatch::core::config

#endif  // REQMATCH_CORE_CONFIG_H
