#include "config.hpp"

#include "core/format.hpp"
#include "core/theme.hpp"

namespace drape {

Theme create_theme() {
    Theme theme = {};

    theme.special_faces[Face_Type::TEXT] = {7, -1, 0};
    theme.special_faces[Face_Type::CARET] = {-1, -1, Face::REVERSE};
    theme.special_faces[Face_Type::INLINE_SUGGESTION] = {8, -1, Face::ITALICS};

    theme.special_faces[Face_Type::DIAGNOSTIC_HINT] = {8, -1, 0};
    theme.special_faces[Face_Type::DIAGNOSTIC_INFO] = {4, -1, 0};
    theme.special_faces[Face_Type::DIAGNOSTIC_WARNING] = {3, -1, 0};
    theme.special_faces[Face_Type::DIAGNOSTIC_ERROR] = {1, -1, Face::BOLD};

    return theme;
}

Text_Format create_text_format(size_t viewport_width) {
    Text_Format format = {};
    format.viewport_width = viewport_width;
    format.tab_width = 4;
    format.soft_wrap = true;
    return format;
}

}
