#include "face.hpp"

namespace drape {

void apply_face(Face* face, Face layer) {
    face->flags |= (layer.flags & ~Face::Flags::REVERSE);
    face->flags ^= (layer.flags & Face::Flags::REVERSE);
    if (layer.foreground != -1 && face->foreground == -1) {
        face->foreground = layer.foreground;
    }
    if (layer.background != -1 && face->background == -1) {
        face->background = layer.background;
    }
}

}
