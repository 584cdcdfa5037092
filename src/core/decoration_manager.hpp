#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/vector.hpp>
#include "decoration.hpp"
#include "position.hpp"

namespace drape {
struct Formatted_Grapheme;

namespace render {
struct Text_Renderer;
}

/// Dispatches the events of one render pass to every registered decoration.
///
/// Registration order is both the drawing order and the order virtual lines
/// are stacked in.  For each frame the host calls `prepare_for_rendering`
/// and then, for each visual line, `decorate_line`, `decorate_grapheme` for
/// every grapheme in order, and finally `render_virtual_lines`.
struct Decoration_Manager {
    struct Entry {
        Decoration decoration;
        Anchor anchor;
    };

    cz::Vector<Entry> decorations;

    /// The character index of the last grapheme dispatched.  Used
    /// to check that graphemes are never dispatched out of order.
    uint64_t last_char_idx;

    /// Takes ownership of `decoration`.
    void add_decoration(Decoration decoration);

    void prepare_for_rendering(uint64_t first_visible_char);

    void decorate_line(render::Text_Renderer* renderer, Line_Pos pos);
    void decorate_grapheme(render::Text_Renderer* renderer, const Formatted_Grapheme& grapheme);
    void render_virtual_lines(render::Text_Renderer* renderer, Line_Pos pos);

    void drop();
};

}
