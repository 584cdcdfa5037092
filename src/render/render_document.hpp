#pragma once

#include <stddef.h>
#include <stdint.h>

namespace cz {
struct Str;
}

namespace drape {
struct Decoration_Manager;
struct Text_Annotations;
struct Text_Format;
struct Theme;

namespace decorations {
struct Caret_Cache;
}

namespace render {
struct Text_Renderer;

/// Draw `text` starting at `first_visible_char` (the start of a document line)
/// into `renderer`, running `manager`'s decorations along the way.
///
/// `manager` is prepared for the frame here.  Rendering stops at the bottom of
/// the viewport.
void render_document(Text_Renderer* renderer,
                     cz::Str text,
                     uint64_t first_visible_char,
                     const Text_Format& format,
                     const Text_Annotations& annotations,
                     Decoration_Manager* manager,
                     const Theme& theme);

/// Draw the caret recorded by `decorations::decoration_caret` this frame, if any.
void draw_caret(Text_Renderer* renderer, const decorations::Caret_Cache& cache, const Theme& theme);

}
}
