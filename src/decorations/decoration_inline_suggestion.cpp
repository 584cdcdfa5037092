#include "decoration_inline_suggestion.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include <cz/string.hpp>
#include <tracy/Tracy.hpp>
#include "config.hpp"
#include "core/decoration.hpp"
#include "core/format.hpp"
#include "render/text_renderer.hpp"

namespace drape {
namespace decorations {

namespace decoration_inline_suggestion_impl {
struct Data {
    Face face;
    cz::String text;
    uint64_t row;
    uint64_t col;
    size_t view_width;
};
}
using namespace decoration_inline_suggestion_impl;

/// Format `line` on its own, without any other annotations, and draw
/// every grapheme at or after `min_col` offset down by `row`.
static void draw_suggestion_line(render::Text_Renderer* renderer,
                                 const Data* data,
                                 cz::Str line,
                                 uint64_t min_col,
                                 size_t row) {
    Text_Format format = create_text_format(data->view_width);
    Text_Annotations annotations = {};

    Document_Formatter formatter;
    formatter.init(line, format, annotations, 0);

    Formatted_Grapheme grapheme;
    while (formatter.next(&grapheme)) {
        if (grapheme.char_idx < min_col) {
            continue;
        }
        renderer->draw_decoration_grapheme(grapheme, data->face, row + grapheme.visual_pos.row,
                                           grapheme.visual_pos.col);
    }
}

static void decoration_inline_suggestion_decorate_line(render::Text_Renderer* renderer,
                                                       Line_Pos pos,
                                                       void* _data) {
    Data* data = (Data*)_data;
    if (pos.doc_line != data->row) {
        return;
    }

    ZoneScoped;

    cz::Str first_line = data->text.as_str();
    cz::Str rest;
    data->text.as_str().split_excluding('\n', &first_line, &rest);

    draw_suggestion_line(renderer, data, first_line, data->col, pos.visual_line);
}

static size_t decoration_inline_suggestion_render_virt_lines(render::Text_Renderer* renderer,
                                                            Line_Pos pos,
                                                            size_t virt_offset,
                                                            void* _data) {
    Data* data = (Data*)_data;
    if (pos.doc_line != data->row) {
        return 0;
    }

    ZoneScoped;

    cz::Str first_line;
    cz::Str lines;
    if (!data->text.as_str().split_excluding('\n', &first_line, &lines)) {
        return 0;
    }

    // Count the lines first so the number of rows taken up is known before drawing.
    size_t num_lines = 1;
    for (size_t i = 0; i < lines.len; ++i) {
        if (lines[i] == '\n') {
            ++num_lines;
        }
    }

    for (size_t index = 0; index < num_lines; ++index) {
        cz::Str line = lines;
        lines.split_excluding('\n', &line, &lines);
        draw_suggestion_line(renderer, data, line, 0, pos.visual_line + virt_offset + index);
    }

    return num_lines;
}

static void decoration_inline_suggestion_cleanup(void* _data) {
    Data* data = (Data*)_data;
    data->text.drop(cz::heap_allocator());
    cz::heap_allocator().dealloc(data);
}

Decoration decoration_inline_suggestion_at(Face face,
                                           cz::Str suggestion,
                                           uint64_t row,
                                           uint64_t col,
                                           size_t view_width) {
    static const Decoration::VTable vtable = {
        nullptr,
        nullptr,
        decoration_inline_suggestion_decorate_line,
        nullptr,
        decoration_inline_suggestion_render_virt_lines,
        decoration_inline_suggestion_cleanup,
    };

    Data* data = cz::heap_allocator().alloc<Data>();
    CZ_ASSERT(data);
    data->face = face;
    data->text = suggestion.clone(cz::heap_allocator());
    data->row = row;
    data->col = col;
    data->view_width = view_width;
    return {&vtable, data};
}

Decoration decoration_inline_suggestion(Face face,
                                        cz::Str doc_text,
                                        cz::Str suggestion,
                                        uint64_t suggestion_pos,
                                        size_t view_width) {
    Position coords = position_of_char(doc_text, suggestion_pos);
    return decoration_inline_suggestion_at(face, suggestion, coords.row, coords.col, view_width);
}

}
}
