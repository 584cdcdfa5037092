#include "decoration_manager.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>
#include "format.hpp"
#include "render/text_renderer.hpp"
#include "tracy_format.hpp"

namespace drape {

void Decoration_Manager::add_decoration(Decoration decoration) {
    Entry entry = {};
    entry.decoration = decoration;
    entry.anchor = 0;

    decorations.reserve(cz::heap_allocator(), 1);
    decorations.push(entry);
}

void Decoration_Manager::prepare_for_rendering(uint64_t first_visible_char) {
    ZoneScoped;

    last_char_idx = first_visible_char;
    for (size_t i = 0; i < decorations.len; ++i) {
        Entry* entry = &decorations[i];
        entry->anchor = entry->decoration.reset_pos(first_visible_char);
    }
}

void Decoration_Manager::decorate_line(render::Text_Renderer* renderer, Line_Pos pos) {
    for (size_t i = 0; i < decorations.len; ++i) {
        decorations[i].decoration.decorate_line(renderer, pos);
    }
}

void Decoration_Manager::decorate_grapheme(render::Text_Renderer* renderer,
                                           const Formatted_Grapheme& grapheme) {
    CZ_DEBUG_ASSERT(grapheme.char_idx >= last_char_idx);
    last_char_idx = grapheme.char_idx;

    for (size_t i = 0; i < decorations.len; ++i) {
        Entry* entry = &decorations[i];
        while (entry->anchor.is_present) {
            uint64_t anchor = entry->anchor.value;
            if (anchor < grapheme.char_idx) {
                // The anchor was concealed or is before the first grapheme.
                entry->anchor = entry->decoration.skip_concealed_anchor(grapheme.char_idx);
                CZ_DEBUG_ASSERT(!entry->anchor.is_present || entry->anchor.value > anchor);
            } else if (anchor == grapheme.char_idx) {
                entry->anchor = entry->decoration.decorate_grapheme(renderer, grapheme);
                // Returning the same index fires the hook again on this grapheme.
                CZ_DEBUG_ASSERT(!entry->anchor.is_present || entry->anchor.value >= anchor);
            } else {
                break;
            }
        }
    }
}

void Decoration_Manager::render_virtual_lines(render::Text_Renderer* renderer, Line_Pos pos) {
    // Start at 1 so the line itself is never overwritten.
    size_t virt_offset = 1;
    for (size_t i = 0; i < decorations.len; ++i) {
        if (pos.visual_line + virt_offset >= renderer->viewport.height) {
            TracyFormat(message, len, 128, "Virtual lines truncated at visual line %zu: %zu skipped",
                        pos.visual_line, decorations.len - i);
            TracyMessage(message, len);
            break;
        }

        virt_offset += decorations[i].decoration.render_virt_lines(renderer, pos, virt_offset);
    }
}

void Decoration_Manager::drop() {
    for (size_t i = 0; i < decorations.len; ++i) {
        decorations[i].decoration.cleanup();
    }
    decorations.drop(cz::heap_allocator());
}

}
