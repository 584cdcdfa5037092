#include "decoration_line_callback.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include "core/decoration.hpp"

namespace drape {
namespace decorations {

namespace decoration_line_callback_impl {
struct Data {
    Line_Callback callback;
    void* user_data;
};
}
using namespace decoration_line_callback_impl;

static void decoration_line_callback_decorate_line(render::Text_Renderer* renderer,
                                                   Line_Pos pos,
                                                   void* _data) {
    Data* data = (Data*)_data;
    data->callback(renderer, pos, data->user_data);
}

static void decoration_line_callback_cleanup(void* data) {
    cz::heap_allocator().dealloc((Data*)data);
}

Decoration decoration_line_callback(Line_Callback callback, void* user_data) {
    static const Decoration::VTable vtable = {
        nullptr,
        nullptr,
        decoration_line_callback_decorate_line,
        nullptr,
        nullptr,
        decoration_line_callback_cleanup,
    };

    CZ_ASSERT(callback);

    Data* data = cz::heap_allocator().alloc<Data>();
    CZ_ASSERT(data);
    data->callback = callback;
    data->user_data = user_data;
    return {&vtable, data};
}

}
}
