#pragma once
#include <string>
#include <vector>

namespace tlc::graph {

// Filter-expression escaping. Only applied to paths embedded in filter text,
// never to -i or output arguments.

// subtitles='...' argument: \ -> \\, : -> \:, ' -> \'
std::string escape_filter_path(const std::string& path);

// One fontsdir entry: \ -> /, : -> \:, ' -> \'
std::string escape_font_dir(const std::string& dir);

#ifdef _WIN32
inline constexpr char kFontDirSeparator = ';';
#else
inline constexpr char kFontDirSeparator = ':';
#endif

// Escaped directories joined with `separator`.
std::string join_font_dirs(const std::vector<std::string>& dirs, char separator = kFontDirSeparator);

// ":fontsdir='...'" or empty when there are no directories.
std::string fontsdir_option(const std::vector<std::string>& dirs, char separator = kFontDirSeparator);

// drawtext text='...' payload: backslash, colon, quote, percent and newline.
std::string escape_drawtext(const std::string& text);

} // namespace tlc::graph
