#ifndef TAGTEXT_CORE_CONFIG_H
#define TAGTEXT_CORE_CONFIG_H

#include <string_view>

namespace tagtext::core::config {

inline constexpr char kTagStart = '<';
inline constexpr char kTagEnd = '>';
inline constexpr char kCloseMarker = '/';
inline constexpr char kParamSeparator = ':';
inline constexpr char kEscapeMarker = '\\';

// Tag that suspends interpretation until its own close tag.
inline constexpr std::string_view kRawTagName = "pre";

inline constexpr const char kDiagnosticModule[] = "markup";

inline constexpr const char kProgramName[] = "tagtext";
inline constexpr const char kVersionString[] = "tagtext 0.1.0";

}  // namespace tagtext::core::config

#endif  // TAGTEXT_CORE_CONFIG_H
