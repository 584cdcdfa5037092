#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/buffer_array.hpp>
#include <cz/defer.hpp>
#include <cz/string.hpp>
#include <cz/vector.hpp>
#include <czt/test_base.hpp>
#include "core/decoration_manager.hpp"
#include "core/format.hpp"
#include "core/theme.hpp"
#include "render/text_renderer.hpp"

namespace drape {

struct Test_Runner {
    cz::Buffer_Array buffer_array;
    cz::Vector<render::Cell> cells;
    render::Text_Renderer renderer;
    Decoration_Manager manager;
    Theme theme;
    Text_Format format;

    Test_Runner(size_t width, size_t height);
    ~Test_Runner();
    Test_Runner(const Test_Runner&) = delete;
    Test_Runner& operator=(const Test_Runner&) = delete;

    /// Render `text` starting at `first_visible_char` with the registered decorations.
    void render(cz::Str text,
                uint64_t first_visible_char = 0,
                const Text_Annotations& annotations = {});

    /// Stringify one row of the screen without trailing spaces.
    cz::String stringify_row(size_t row);

    /// Stringify every row of the screen joined with newlines.
    /// Trailing spaces and trailing empty rows are removed.
    cz::String stringify();

    Face face_at(size_t row, size_t col) const { return renderer.at(row, col).face; }

    cz::Allocator allocator() { return buffer_array.allocator(); }
};

/// A grapheme at `char_idx` on the first row.  Only the index matters to the manager.
Formatted_Grapheme test_grapheme(uint64_t char_idx);

}
