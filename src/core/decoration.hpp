#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/option.hpp>
#include "position.hpp"

namespace drape {
struct Formatted_Grapheme;

namespace render {
struct Text_Renderer;
}

/// The next character index a decoration wants to act at.  An empty
/// anchor means the decoration is done for the rest of the render pass.
using Anchor = cz::Option<uint64_t>;

/// Decorations draw things anchored to the rendered text (carets, inline
/// completions, diagnostics) while the text is being rendered.  Translating
/// character positions to screen positions is done once by the formatter and
/// handed to every decoration through these hooks instead.
///
/// Every hook in the `VTable` may be `nullptr`:
/// * `reset_pos` defaults to an empty anchor.
/// * `skip_concealed_anchor` defaults to `reset_pos`.
/// * `decorate_grapheme` defaults to an empty anchor.
/// * `decorate_line` defaults to doing nothing.
/// * `render_virt_lines` defaults to taking up no rows.
/// * `cleanup` defaults to doing nothing.
///
/// To reserve space for virtual lines (which are then filled by
/// `render_virt_lines`) emit a `Line_Annotation` when formatting.
struct Decoration {
    struct VTable {
        /// Called once per frame with the first visible character.
        /// Returns the first character to act at.
        Anchor (*reset_pos)(uint64_t first_visible_char, void* data);

        /// Called when the text containing the anchor was concealed.
        /// `conceal_end` is the first character rendered after it.
        Anchor (*skip_concealed_anchor)(uint64_t conceal_end, void* data);

        /// Called **before** the text of a visual line is drawn.  Setting the
        /// foreground here is useless as drawing the text overwrites it.
        void (*decorate_line)(render::Text_Renderer* renderer, Line_Pos pos, void* data);

        /// Called **before** the grapheme at the anchor is drawn.
        /// Returns the next anchor.
        Anchor (*decorate_grapheme)(render::Text_Renderer* renderer,
                                    const Formatted_Grapheme& grapheme,
                                    void* data);

        /// Called **after** a visual line is drawn.  May draw in the virtual rows
        /// `pos.visual_line + virt_offset .. pos.visual_line + virt_offset + N`
        /// and must return `N`, the number of rows it took up.
        size_t (*render_virt_lines)(render::Text_Renderer* renderer,
                                    Line_Pos pos,
                                    size_t virt_offset,
                                    void* data);

        void (*cleanup)(void* data);
    };

    const VTable* vtable;
    void* data;

    Anchor reset_pos(uint64_t first_visible_char) const {
        if (!vtable->reset_pos) {
            return {};
        }
        return vtable->reset_pos(first_visible_char, data);
    }

    Anchor skip_concealed_anchor(uint64_t conceal_end) const {
        if (!vtable->skip_concealed_anchor) {
            return reset_pos(conceal_end);
        }
        return vtable->skip_concealed_anchor(conceal_end, data);
    }

    void decorate_line(render::Text_Renderer* renderer, Line_Pos pos) const {
        if (vtable->decorate_line) {
            vtable->decorate_line(renderer, pos, data);
        }
    }

    Anchor decorate_grapheme(render::Text_Renderer* renderer,
                             const Formatted_Grapheme& grapheme) const {
        if (!vtable->decorate_grapheme) {
            return {};
        }
        return vtable->decorate_grapheme(renderer, grapheme, data);
    }

    size_t render_virt_lines(render::Text_Renderer* renderer,
                             Line_Pos pos,
                             size_t virt_offset) const {
        if (!vtable->render_virt_lines) {
            return 0;
        }
        return vtable->render_virt_lines(renderer, pos, virt_offset, data);
    }

    void cleanup() {
        if (vtable->cleanup) {
            vtable->cleanup(data);
        }
    }
};

}
