#include "decoration_caret.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include "core/decoration.hpp"
#include "core/format.hpp"
#include "render/text_renderer.hpp"

namespace drape {
namespace decorations {

namespace decoration_caret_impl {
struct Data {
    Caret_Cache* cache;
    uint64_t target_pos;
};
}
using namespace decoration_caret_impl;

static Anchor decoration_caret_reset_pos(uint64_t first_visible_char, void* _data) {
    Data* data = (Data*)_data;
    // If the caret is before the visible region then it won't be drawn this frame.
    if (first_visible_char <= data->target_pos) {
        return data->target_pos;
    }
    return {};
}

static Anchor decoration_caret_decorate_grapheme(render::Text_Renderer* renderer,
                                                 const Formatted_Grapheme& grapheme,
                                                 void* _data) {
    Data* data = (Data*)_data;
    if (renderer->column_in_bounds(grapheme.visual_pos.col)) {
        Position position = grapheme.visual_pos;
        position.col -= renderer->col_offset;
        data->cache->set(position);
    }
    return {};
}

static void decoration_caret_cleanup(void* data) {
    cz::heap_allocator().dealloc((Data*)data);
}

Decoration decoration_caret(Caret_Cache* cache, uint64_t target_pos) {
    static const Decoration::VTable vtable = {
        decoration_caret_reset_pos,
        nullptr,
        nullptr,
        decoration_caret_decorate_grapheme,
        nullptr,
        decoration_caret_cleanup,
    };

    Data* data = cz::heap_allocator().alloc<Data>();
    CZ_ASSERT(data);
    data->cache = cache;
    data->target_pos = target_pos;
    return {&vtable, data};
}

}
}
