#pragma once

#include <stddef.h>

namespace drape {

struct Text_Format;
struct Theme;

Theme create_theme();
Text_Format create_text_format(size_t viewport_width);

}
