#pragma once

#include "core/position.hpp"

namespace drape {
struct Decoration;

namespace render {
struct Text_Renderer;
}

namespace decorations {

typedef void (*Line_Callback)(render::Text_Renderer* renderer, Line_Pos pos, void* user_data);

/// A decoration that only runs `callback` before each visual line is drawn.
/// `user_data` is passed through and is not owned by the decoration.
Decoration decoration_line_callback(Line_Callback callback, void* user_data);

}
}
