// source.hpp - original file bytes plus an offset -> line table
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace errorsmith {

class SourceFile {
public:
    SourceFile(std::string name, std::string content);

    const std::string& name() const { return name_; }
    const std::string& content() const { return content_; }
    std::size_t size() const { return content_.size(); }

    // 1-based line containing byte offset pos (pos == size() maps to the last line).
    int line(std::size_t pos) const;
    // 1-based column of pos within its line.
    int column(std::size_t pos) const;

private:
    std::string name_;
    std::string content_;
    std::vector<std::size_t> line_starts_;
};

} // namespace errorsmith
