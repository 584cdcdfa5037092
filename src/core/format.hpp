#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/slice.hpp>
#include <cz/string.hpp>
#include "position.hpp"

namespace drape {

struct Text_Format {
    /// The number of columns available before soft wrapping.
    size_t viewport_width;

    /// The number of columns a tab takes up.
    uint32_t tab_width;

    /// If `true`, then long lines will be displayed as multiple visual lines.
    bool soft_wrap;
};

/// A span `[start, end)` of the document that is not rendered (folds, concealed markup).
struct Concealed_Span {
    uint64_t start;
    uint64_t end;
};

/// Reserve `virtual_rows` empty rows below the last visual line of `doc_line`.
/// Decorations fill these rows from `render_virt_lines`.
struct Line_Annotation {
    uint64_t doc_line;
    size_t virtual_rows;
};

/// Annotations composited into the formatted text.  Both slices must be sorted
/// and non-overlapping.  Default constructed annotations are empty.
struct Text_Annotations {
    cz::Slice<const Concealed_Span> concealed_spans;
    cz::Slice<const Line_Annotation> line_annotations;
};

struct Formatted_Grapheme {
    /// Index of the grapheme's first byte in the source text.
    uint64_t char_idx;

    /// Visual position relative to the formatter's starting point.
    /// The column is not adjusted for horizontal scrolling.
    Position visual_pos;

    /// The rendered text.  Empty for newlines and the end of the text as
    /// these occupy a column (the caret can sit on them) but draw nothing.
    /// For tabs this is `"\t"` and `width` says how many columns it covers.
    cz::Str raw;

    /// The number of columns the grapheme takes up.
    size_t width;
};

/// Lazily positions the graphemes of `text` starting at `start`.  `start` must
/// be the start of a document line.  `next()` yields graphemes in strictly
/// increasing character order and `reset()` restarts the sequence.
///
/// `raw` of the yielded grapheme may point into the formatter itself so it is
/// only valid until the next call to `next()`.
struct Document_Formatter {
    cz::Str text;
    const Text_Format* format;
    const Text_Annotations* annotations;
    uint64_t start;
    uint64_t start_line;

    uint64_t position;
    uint64_t line;
    size_t row;
    size_t column;
    size_t concealed_index;
    size_t line_annotation_index;
    bool done;

    /// The document line of the last yielded grapheme.
    uint64_t grapheme_line;

    char escape[8];

    void init(cz::Str text,
              const Text_Format& format,
              const Text_Annotations& annotations,
              uint64_t start);
    void reset();

    bool next(Formatted_Grapheme* grapheme);
};

/// The column after drawing `ch` starting at `column`.
size_t char_visual_columns(const Text_Format& format, char ch, size_t column);

/// Get the row (number of newlines before) and byte column of `position`.
Position position_of_char(cz::Str text, uint64_t position);

/// Get the index of the first character of `line`.  Clamps to `text.len`.
uint64_t char_idx_at_line(cz::Str text, uint64_t line);

}
