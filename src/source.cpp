#include "errorsmith/source.hpp"
#include <algorithm>

namespace errorsmith {

SourceFile::SourceFile(std::string name, std::string content)
    : name_(std::move(name)), content_(std::move(content)) {
    line_starts_.push_back(0);
    for(std::size_t i=0;i<content_.size();++i){ if(content_[i]=='\n') line_starts_.push_back(i+1); }
}

int SourceFile::line(std::size_t pos) const {
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), pos);
    return static_cast<int>(it - line_starts_.begin());
}

int SourceFile::column(std::size_t pos) const {
    const int l = line(pos);
    return static_cast<int>(pos - line_starts_[static_cast<std::size_t>(l-1)]) + 1;
}

} // namespace errorsmith
