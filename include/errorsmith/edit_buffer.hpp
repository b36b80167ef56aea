// edit_buffer.hpp - insertion-only edit ledger over an immutable byte sequence
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace errorsmith {

// An Edit inserts text immediately before the original byte at `pos`.
struct Edit {
    std::size_t pos;
    std::string text;
};

// Edits are keyed by offsets into the ORIGINAL bytes, so recording one never
// shifts the offsets of the others. Several edits at one offset render in the
// order they were recorded.
class EditBuffer {
public:
    explicit EditBuffer(std::string_view original) : original_(original) {}

    // Record an insertion. pos may be anything in [0, size()]; throws std::out_of_range otherwise.
    void insert(std::size_t pos, std::string text);

    // Original bytes with every recorded edit applied. Pure; may be called any number of times.
    std::string materialize() const;

    const std::string& original() const { return original_; }
    std::size_t size() const { return original_.size(); }
    std::size_t edit_count() const { return edits_.size(); }
    const std::vector<Edit>& edits() const { return edits_; }

private:
    std::string original_;
    std::vector<Edit> edits_;
};

} // namespace errorsmith
