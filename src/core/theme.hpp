#pragma once

#include <stdint.h>
#include "face.hpp"

namespace drape {

namespace Face_Type_ {
enum Face_Type : uint64_t {
    TEXT,
    CARET,
    INLINE_SUGGESTION,

    DIAGNOSTIC_HINT,
    DIAGNOSTIC_INFO,
    DIAGNOSTIC_WARNING,
    DIAGNOSTIC_ERROR,

    // Special value representing the number of values in the enum.
    length,
};
}
using Face_Type_::Face_Type;

struct Theme {
    /// The way different things are rendered.
    Face special_faces[Face_Type::length];

    /// The marker drawn under the column a diagnostic points at.
    char diagnostic_marker = '^';
};

}
