#include "errorsmith/edit_buffer.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace errorsmith {

void EditBuffer::insert(std::size_t pos, std::string text){
    if(pos > original_.size()){
        throw std::out_of_range("edit position " + std::to_string(pos) + " past end of buffer (size " + std::to_string(original_.size()) + ")");
    }
    edits_.push_back(Edit{pos, std::move(text)});
}

std::string EditBuffer::materialize() const {
    // Visit edits by position; stable so ties keep call order.
    std::vector<std::size_t> order(edits_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b){ return edits_[a].pos < edits_[b].pos; });

    std::size_t extra = 0;
    for(const auto& e : edits_) extra += e.text.size();
    std::string out;
    out.reserve(original_.size() + extra);

    std::size_t copied = 0;
    for(std::size_t idx : order){
        const Edit& e = edits_[idx];
        out.append(original_, copied, e.pos - copied);
        copied = e.pos;
        out += e.text;
    }
    out.append(original_, copied, std::string::npos);
    return out;
}

} // namespace errorsmith
