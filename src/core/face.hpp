#pragma once

#include <stdint.h>

namespace drape {

/// A display style.  Colors are indexes into the terminal's palette; `-1` means
/// the color is unset and a lower layer (or the terminal default) is used.
struct Face {
    int16_t foreground = -1;
    int16_t background = -1;

    enum Flags {
        BOLD = 1,
        UNDERSCORE = 2,
        REVERSE = 4,
        ITALICS = 8,
        INVISIBLE = 16,
    };
    uint32_t flags = 0;

    Face() = default;
    Face(int16_t foreground, int16_t background, uint32_t flags)
        : foreground(foreground), background(background), flags(flags) {}

    bool operator==(const Face& other) const {
        return foreground == other.foreground && background == other.background &&
               flags == other.flags;
    }
    bool operator!=(const Face& other) const { return !(*this == other); }
};

/// Layer `layer` below `face`.  Colors already set in `face` win and `REVERSE` toggles.
void apply_face(Face* face, Face layer);

}
