#pragma once

#include <stddef.h>
#include <cz/string.hpp>
#include "cell.hpp"
#include "core/face.hpp"

namespace drape {
struct Formatted_Grapheme;

namespace render {

struct Viewport {
    size_t width;
    size_t height;
};

/// Draws into a `viewport.height * viewport.width` grid of cells.  The
/// cells are owned by the caller and must outlive the renderer.
struct Text_Renderer {
    Cell* cells;
    Viewport viewport;

    /// The number of columns scrolled horizontally.  Always 0 with soft wrap.
    size_t col_offset;

    void init(Cell* cells, Viewport viewport, size_t col_offset = 0);

    Cell& at(size_t row, size_t col) { return cells[row * viewport.width + col]; }
    const Cell& at(size_t row, size_t col) const { return cells[row * viewport.width + col]; }

    /// Test if the visual column `col` is visible after horizontal scrolling.
    bool column_in_bounds(size_t col) const {
        return col >= col_offset && col < col_offset + viewport.width;
    }

    void clear(Face face);

    /// Draw a document grapheme at its visual position.
    void draw_grapheme(const Formatted_Grapheme& grapheme, Face face);

    /// Draw a grapheme at an explicit viewport `row` and `col`.  Horizontal scrolling
    /// isn't applied.  Returns `false` if nothing was drawn because it was out of bounds.
    bool draw_decoration_grapheme(const Formatted_Grapheme& grapheme,
                                  Face face,
                                  size_t row,
                                  size_t col);

    /// Draw printable text at `row` and `col`, clipped at the right edge.
    /// Returns the number of columns drawn.
    size_t draw_str(cz::Str str, Face face, size_t row, size_t col);

    /// Layer `face` on top of the face of the cell at `row` and `col`.
    void set_face(size_t row, size_t col, Face face);
};

}
}
