#include "render_document.hpp"

#include <cz/assert.hpp>
#include <cz/string.hpp>
#include <tracy/Tracy.hpp>
#include "core/decoration_manager.hpp"
#include "core/format.hpp"
#include "core/theme.hpp"
#include "decorations/decoration_caret.hpp"
#include "text_renderer.hpp"

namespace drape {
namespace render {

void render_document(Text_Renderer* renderer,
                     cz::Str text,
                     uint64_t first_visible_char,
                     const Text_Format& format,
                     const Text_Annotations& annotations,
                     Decoration_Manager* manager,
                     const Theme& theme) {
    ZoneScoped;

    // Wrapping and horizontal scrolling are mutually exclusive.
    CZ_DEBUG_ASSERT(!format.soft_wrap || renderer->col_offset == 0);

    manager->prepare_for_rendering(first_visible_char);

    Document_Formatter formatter;
    formatter.init(text, format, annotations, first_visible_char);

    Face face = theme.special_faces[Face_Type::TEXT];

    Line_Pos pos = {};
    bool in_line = false;

    Formatted_Grapheme grapheme;
    while (formatter.next(&grapheme)) {
        if (grapheme.visual_pos.row >= renderer->viewport.height) {
            break;
        }

        if (!in_line || grapheme.visual_pos.row != pos.visual_line) {
            if (in_line) {
                manager->render_virtual_lines(renderer, pos);
            }

            if (in_line && formatter.grapheme_line == pos.doc_line) {
                ++pos.row_offset;
            } else {
                pos.row_offset = 0;
            }
            pos.doc_line = formatter.grapheme_line;
            pos.visual_line = grapheme.visual_pos.row;
            in_line = true;

            manager->decorate_line(renderer, pos);
        }

        manager->decorate_grapheme(renderer, grapheme);
        renderer->draw_grapheme(grapheme, face);
    }

    if (in_line) {
        manager->render_virtual_lines(renderer, pos);
    }
}

void draw_caret(Text_Renderer* renderer, const decorations::Caret_Cache& cache, const Theme& theme) {
    if (!cache.position.is_present) {
        return;
    }

    Position position = cache.position.value;
    if (position.row >= renderer->viewport.height || position.col >= renderer->viewport.width) {
        return;
    }

    renderer->set_face(position.row, position.col, theme.special_faces[Face_Type::CARET]);
}

}
}
