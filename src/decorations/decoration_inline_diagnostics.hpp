#pragma once

#include <stdint.h>
#include <cz/slice.hpp>
#include <cz/string.hpp>

namespace drape {
struct Decoration;
struct Theme;

namespace decorations {

namespace Severity_ {
enum Severity {
    HINT,
    INFO,
    WARNING,
    ERROR,
};
}
using Severity_::Severity;

struct Diagnostic {
    uint64_t position;
    Severity severity;
    cz::Str message;
};

/// Show diagnostics in virtual lines below the visual line they point at.
///
/// Each diagnostic gets its own virtual row with the theme's diagnostic marker
/// under the column of `position` followed by the message.  Every further line
/// of the message takes another row, aligned with the first.  Diagnostics on
/// concealed text or scrolled out of view horizontally aren't shown.
///
/// The diagnostics and their messages are copied.
Decoration decoration_inline_diagnostics(cz::Slice<const Diagnostic> diagnostics,
                                         const Theme& theme);

}
}
