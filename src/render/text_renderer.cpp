#include "text_renderer.hpp"

#include <cz/assert.hpp>
#include "core/format.hpp"

namespace drape {
namespace render {

void Text_Renderer::init(Cell* cells, Viewport viewport, size_t col_offset) {
    CZ_DEBUG_ASSERT(cells || viewport.width * viewport.height == 0);
    this->cells = cells;
    this->viewport = viewport;
    this->col_offset = col_offset;
}

void Text_Renderer::clear(Face face) {
    for (size_t i = 0; i < viewport.width * viewport.height; ++i) {
        cells[i].face = face;
        cells[i].code = ' ';
    }
}

bool Text_Renderer::draw_decoration_grapheme(const Formatted_Grapheme& grapheme,
                                             Face face,
                                             size_t row,
                                             size_t col) {
    if (row >= viewport.height || col >= viewport.width) {
        return false;
    }

    // Newlines and the end of the text take up space but have nothing to draw.
    if (grapheme.raw.len == 0) {
        return true;
    }

    if (grapheme.raw.len == 1 && grapheme.raw[0] == '\t') {
        for (size_t i = 0; i < grapheme.width && col + i < viewport.width; ++i) {
            Cell* cell = &at(row, col + i);
            cell->face = face;
            cell->code = ' ';
        }
        return true;
    }

    draw_str(grapheme.raw, face, row, col);
    return true;
}

void Text_Renderer::draw_grapheme(const Formatted_Grapheme& grapheme, Face face) {
    size_t col = grapheme.visual_pos.col;
    size_t end = col + grapheme.width;
    if (grapheme.visual_pos.row >= viewport.height || end <= col_offset ||
        col >= col_offset + viewport.width) {
        return;
    }

    // A wide grapheme scrolled partially off the left edge is drawn as blanks.
    if (col < col_offset) {
        for (size_t x = 0; x < end - col_offset && x < viewport.width; ++x) {
            Cell* cell = &at(grapheme.visual_pos.row, x);
            cell->face = face;
            cell->code = ' ';
        }
        return;
    }

    draw_decoration_grapheme(grapheme, face, grapheme.visual_pos.row, col - col_offset);
}

size_t Text_Renderer::draw_str(cz::Str str, Face face, size_t row, size_t col) {
    if (row >= viewport.height) {
        return 0;
    }

    size_t i = 0;
    for (; i < str.len && col + i < viewport.width; ++i) {
        Cell* cell = &at(row, col + i);
        cell->face = face;
        cell->code = str[i];
    }
    return i;
}

void Text_Renderer::set_face(size_t row, size_t col, Face face) {
    CZ_DEBUG_ASSERT(row < viewport.height);
    CZ_DEBUG_ASSERT(col < viewport.width);

    Cell* cell = &at(row, col);
    apply_face(&face, cell->face);
    cell->face = face;
}

}
}
