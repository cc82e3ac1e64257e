#pragma once
#include <map>
#include <string>
#include <vector>

namespace tlc::compiler {

// Collaborator: font family names -> local directories that hold them.
class FontResolver {
public:
    virtual ~FontResolver() = default;
    virtual std::vector<std::string> directories_for(const std::vector<std::string>& families) const = 0;
};

// Resolves through a family -> directories table (the job's "font_directories").
class TableFontResolver : public FontResolver {
public:
    explicit TableFontResolver(std::map<std::string, std::vector<std::string>> table);
    std::vector<std::string> directories_for(const std::vector<std::string>& families) const override;

private:
    std::map<std::string, std::vector<std::string>> table_;
};

} // namespace tlc::compiler
