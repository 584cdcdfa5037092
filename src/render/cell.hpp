#pragma once

#include "core/face.hpp"

namespace drape {
namespace render {

struct Cell {
    Face face;
    char code;

    bool operator==(const Cell& other) const { return face == other.face && code == other.code; }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

}
}
