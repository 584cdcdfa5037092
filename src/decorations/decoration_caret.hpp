#pragma once

#include <stdint.h>
#include <cz/option.hpp>
#include "core/position.hpp"

namespace drape {
struct Decoration;

namespace decorations {

/// The screen position of the primary caret.  Written at most once per
/// frame while rendering and read afterwards by `render::draw_caret`.
struct Caret_Cache {
    cz::Option<Position> position;

    void set(Position new_position) { position = new_position; }
    void reset() { position = {}; }
};

/// Caret rendering is done externally so all this decoration does
/// is save the screen position of the character at `target_pos`.
Decoration decoration_caret(Caret_Cache* cache, uint64_t target_pos);

}
}
