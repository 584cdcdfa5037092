#pragma once

#include <stddef.h>
#include <stdint.h>
#include "core/face.hpp"

namespace cz {
struct Str;
}

namespace drape {
struct Decoration;

namespace decorations {

/// Draw `suggestion` as ghost text continuing from `suggestion_pos` in `doc_text`.
///
/// The first line of the suggestion is drawn on the line containing `suggestion_pos`
/// starting at its column; the remaining lines are drawn in virtual lines below it.
/// The suggestion is wrapped to `view_width` independently of the document.
/// Only one virtual row is taken up per trailing line so a trailing line wider
/// than `view_width` overlaps the rows below it.
///
/// Lines of the suggestion are positioned from the start of the line so `suggestion`
/// should include the text before `suggestion_pos` on its first line.
Decoration decoration_inline_suggestion(Face face,
                                        cz::Str doc_text,
                                        cz::Str suggestion,
                                        uint64_t suggestion_pos,
                                        size_t view_width);

/// Same as above but with the target row and column already known.
Decoration decoration_inline_suggestion_at(Face face,
                                           cz::Str suggestion,
                                           uint64_t row,
                                           uint64_t col,
                                           size_t view_width);

}
}
