#include "compiler/font_resolver.hpp"
#include "core/log.hpp"
#include <algorithm>

namespace tlc::compiler {

TableFontResolver::TableFontResolver(std::map<std::string, std::vector<std::string>> table)
    : table_(std::move(table)) {
}

std::vector<std::string> TableFontResolver::directories_for(const std::vector<std::string>& families) const {
    std::vector<std::string> dirs;
    for (const auto& family : families) {
        auto it = table_.find(family);
        if (it == table_.end()) {
            log::debug("No font directory registered for family '" + family + "'");
            continue;
        }
        for (const auto& d : it->second) {
            if (std::find(dirs.begin(), dirs.end(), d) == dirs.end()) dirs.push_back(d);
        }
    }
    return dirs;
}

} // namespace tlc::compiler
