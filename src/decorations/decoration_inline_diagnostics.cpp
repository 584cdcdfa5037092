#include "decoration_inline_diagnostics.hpp"

#include <cz/assert.hpp>
#include <cz/buffer_array.hpp>
#include <cz/heap.hpp>
#include <cz/sort.hpp>
#include <cz/vector.hpp>
#include <tracy/Tracy.hpp>
#include "config.hpp"
#include "core/decoration.hpp"
#include "core/format.hpp"
#include "core/theme.hpp"
#include "render/text_renderer.hpp"

namespace drape {
namespace decorations {

namespace decoration_inline_diagnostics_impl {
/// A diagnostic found on the visual line currently being drawn.
struct Pending {
    size_t index;
    size_t col;
};

struct Data {
    Face faces[4];
    char marker;

    cz::Buffer_Array messages_buffer_array;
    cz::Vector<Diagnostic> diagnostics;

    /// The index of the first diagnostic not yet reached.
    size_t next;

    cz::Vector<Pending> pending;
};
}
using namespace decoration_inline_diagnostics_impl;

static Anchor next_anchor(const Data* data) {
    if (data->next < data->diagnostics.len) {
        return data->diagnostics[data->next].position;
    }
    return {};
}

static Anchor decoration_inline_diagnostics_reset_pos(uint64_t first_visible_char, void* _data) {
    Data* data = (Data*)_data;
    data->pending.len = 0;
    data->next = 0;
    while (data->next < data->diagnostics.len &&
           data->diagnostics[data->next].position < first_visible_char) {
        ++data->next;
    }
    return next_anchor(data);
}

static Anchor decoration_inline_diagnostics_skip_concealed_anchor(uint64_t conceal_end,
                                                                  void* _data) {
    Data* data = (Data*)_data;
    while (data->next < data->diagnostics.len &&
           data->diagnostics[data->next].position < conceal_end) {
        ++data->next;
    }
    return next_anchor(data);
}

static void decoration_inline_diagnostics_decorate_line(render::Text_Renderer*,
                                                        Line_Pos,
                                                        void* _data) {
    Data* data = (Data*)_data;
    // Diagnostics that didn't fit below the previous visual line are dropped.
    data->pending.len = 0;
}

static Anchor decoration_inline_diagnostics_decorate_grapheme(render::Text_Renderer* renderer,
                                                              const Formatted_Grapheme& grapheme,
                                                              void* _data) {
    Data* data = (Data*)_data;
    bool visible = renderer->column_in_bounds(grapheme.visual_pos.col);
    for (; data->next < data->diagnostics.len &&
           data->diagnostics[data->next].position == grapheme.char_idx;
         ++data->next) {
        if (visible) {
            data->pending.reserve(cz::heap_allocator(), 1);
            data->pending.push({data->next, grapheme.visual_pos.col - renderer->col_offset});
        }
    }
    return next_anchor(data);
}

static size_t decoration_inline_diagnostics_render_virt_lines(render::Text_Renderer* renderer,
                                                             Line_Pos pos,
                                                             size_t virt_offset,
                                                             void* _data) {
    Data* data = (Data*)_data;
    if (data->pending.len == 0) {
        return 0;
    }

    ZoneScoped;

    Text_Format format = create_text_format(renderer->viewport.width);
    format.soft_wrap = false;
    Text_Annotations annotations = {};

    // Draw the rightmost diagnostic first so that the markers of the
    // diagnostics further left aren't hidden by the longer messages.
    size_t rows = 0;
    for (size_t i = data->pending.len; i-- > 0;) {
        size_t row = pos.visual_line + virt_offset + rows;
        if (row >= renderer->viewport.height) {
            break;
        }

        const Pending& pending = data->pending[i];
        const Diagnostic& diagnostic = data->diagnostics[pending.index];
        Face face = data->faces[diagnostic.severity];

        renderer->draw_str({&data->marker, 1}, face, row, pending.col);

        // Each line of the message gets its own row aligned after the marker.
        size_t last_row = 0;
        Document_Formatter formatter;
        formatter.init(diagnostic.message, format, annotations, 0);
        Formatted_Grapheme grapheme;
        while (formatter.next(&grapheme)) {
            if (row + grapheme.visual_pos.row >= renderer->viewport.height) {
                break;
            }
            if (grapheme.raw.len > 0 && grapheme.visual_pos.row > last_row) {
                last_row = grapheme.visual_pos.row;
            }
            renderer->draw_decoration_grapheme(grapheme, face, row + grapheme.visual_pos.row,
                                               pending.col + 2 + grapheme.visual_pos.col);
        }

        rows += last_row + 1;
    }

    data->pending.len = 0;
    return rows;
}

static void decoration_inline_diagnostics_cleanup(void* _data) {
    Data* data = (Data*)_data;
    data->pending.drop(cz::heap_allocator());
    data->diagnostics.drop(cz::heap_allocator());
    data->messages_buffer_array.drop();
    cz::heap_allocator().dealloc(data);
}

Decoration decoration_inline_diagnostics(cz::Slice<const Diagnostic> diagnostics,
                                         const Theme& theme) {
    static const Decoration::VTable vtable = {
        decoration_inline_diagnostics_reset_pos,
        decoration_inline_diagnostics_skip_concealed_anchor,
        decoration_inline_diagnostics_decorate_line,
        decoration_inline_diagnostics_decorate_grapheme,
        decoration_inline_diagnostics_render_virt_lines,
        decoration_inline_diagnostics_cleanup,
    };

    Data* data = cz::heap_allocator().alloc<Data>();
    CZ_ASSERT(data);
    *data = {};

    data->faces[Severity::HINT] = theme.special_faces[Face_Type::DIAGNOSTIC_HINT];
    data->faces[Severity::INFO] = theme.special_faces[Face_Type::DIAGNOSTIC_INFO];
    data->faces[Severity::WARNING] = theme.special_faces[Face_Type::DIAGNOSTIC_WARNING];
    data->faces[Severity::ERROR] = theme.special_faces[Face_Type::DIAGNOSTIC_ERROR];
    data->marker = theme.diagnostic_marker;

    data->messages_buffer_array.init();
    data->diagnostics.reserve_exact(cz::heap_allocator(), diagnostics.len);
    for (size_t i = 0; i < diagnostics.len; ++i) {
        Diagnostic diagnostic = diagnostics[i];
        diagnostic.message =
            diagnostic.message.clone(data->messages_buffer_array.allocator()).as_str();
        data->diagnostics.push(diagnostic);
    }

    cz::sort(data->diagnostics, [](const Diagnostic* left, const Diagnostic* right) {
        return left->position < right->position;
    });

    return {&vtable, data};
}

}
}
