#include "graph/escaping.hpp"

namespace tlc::graph {

std::string escape_filter_path(const std::string& path) {
    std::string out;
    out.reserve(path.size() + 8);
    for (char c : path) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ':': out += "\\:"; break;
            case '\'': out += "\\'"; break;
            default: out += c;
        }
    }
    return out;
}

std::string escape_font_dir(const std::string& dir) {
    std::string out;
    out.reserve(dir.size() + 4);
    for (char c : dir) {
        switch (c) {
            case '\\': out += '/'; break;
            case ':': out += "\\:"; break;
            case '\'': out += "\\'"; break;
            default: out += c;
        }
    }
    return out;
}

std::string join_font_dirs(const std::vector<std::string>& dirs, char separator) {
    std::string out;
    for (const auto& d : dirs) {
        if (d.empty()) continue;
        if (!out.empty()) out += separator;
        out += escape_font_dir(d);
    }
    return out;
}

std::string fontsdir_option(const std::vector<std::string>& dirs, char separator) {
    std::string joined = join_font_dirs(dirs, separator);
    if (joined.empty()) return {};
    return ":fontsdir='" + joined + "'";
}

std::string escape_drawtext(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ':': out += "\\:"; break;
            case '\'': out += "\\'"; break;
            case '%': out += "\\%"; break;
            case '\n': out += "\\n"; break;
            case '\r': break;
            default: out += c;
        }
    }
    return out;
}

} // namespace tlc::graph
