#pragma once

#include <stddef.h>
#include <stdint.h>

namespace drape {

/// A row and column on the screen or in a document.
struct Position {
    size_t row;
    size_t col;

    bool operator==(const Position& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/// Where a visual line sits.  Supplied by the host once per visual line.
struct Line_Pos {
    /// The document line being rendered.
    uint64_t doc_line;

    /// The viewport row the visual line is drawn at.
    size_t visual_line;

    /// The number of visual lines of `doc_line` drawn before this one.
    /// Non-zero only when soft wrapping splits a document line.
    size_t row_offset;
};

}
