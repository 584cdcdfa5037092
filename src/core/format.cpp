#include "format.hpp"

#include <stdio.h>
#include <cz/assert.hpp>
#include <cz/char_type.hpp>

namespace drape {

size_t char_visual_columns(const Text_Format& format, char ch, size_t column) {
    if (ch == '\t') {
        column += format.tab_width;
        column -= column % format.tab_width;
    } else if (ch == '\n') {
        column++;
    } else if (!cz::is_print(ch)) {
        unsigned char uch = ch;
        // We format non-printable characters as `\[%d;`.
        column += 3;
        if (uch >= 100) {
            column += 3;
        } else if (uch >= 10) {
            column += 2;
        } else {
            column += 1;
        }
    } else {
        column++;
    }
    return column;
}

Position position_of_char(cz::Str text, uint64_t position) {
    if (position > text.len) {
        position = text.len;
    }

    Position result = {};
    uint64_t line_start = 0;
    for (uint64_t i = 0; i < position; ++i) {
        if (text[i] == '\n') {
            ++result.row;
            line_start = i + 1;
        }
    }
    result.col = position - line_start;
    return result;
}

uint64_t char_idx_at_line(cz::Str text, uint64_t line) {
    uint64_t position = 0;
    for (; line > 0; --line) {
        const char* newline = text.slice_start(position).find('\n');
        if (!newline) {
            return text.len;
        }
        position = newline - text.buffer + 1;
    }
    return position;
}

void Document_Formatter::init(cz::Str text,
                              const Text_Format& format,
                              const Text_Annotations& annotations,
                              uint64_t start) {
    CZ_DEBUG_ASSERT(start <= text.len);
    CZ_DEBUG_ASSERT(start == 0 || text[start - 1] == '\n');
    CZ_DEBUG_ASSERT(format.tab_width > 0);

    this->text = text;
    this->format = &format;
    this->annotations = &annotations;
    this->start = start;
    start_line = position_of_char(text, start).row;
    reset();
}

void Document_Formatter::reset() {
    position = start;
    line = start_line;
    row = 0;
    column = 0;
    concealed_index = 0;
    line_annotation_index = 0;
    done = false;
    grapheme_line = start_line;
}

static void skip_concealed_spans(Document_Formatter* formatter) {
    cz::Slice<const Concealed_Span> spans = formatter->annotations->concealed_spans;
    while (formatter->concealed_index < spans.len) {
        const Concealed_Span& span = spans[formatter->concealed_index];
        CZ_DEBUG_ASSERT(span.start <= span.end);
        if (span.end <= formatter->position) {
            ++formatter->concealed_index;
            continue;
        }
        if (span.start > formatter->position) {
            break;
        }

        // Folded lines still count as document lines but take up no rows.
        uint64_t end = span.end;
        if (end > formatter->text.len) {
            end = formatter->text.len;
        }
        for (uint64_t i = formatter->position; i < end; ++i) {
            if (formatter->text[i] == '\n') {
                ++formatter->line;
            }
        }

        formatter->position = end;
        ++formatter->concealed_index;
    }
}

static size_t reserved_virtual_rows(Document_Formatter* formatter, uint64_t line) {
    cz::Slice<const Line_Annotation> line_annotations = formatter->annotations->line_annotations;
    while (formatter->line_annotation_index < line_annotations.len &&
           line_annotations[formatter->line_annotation_index].doc_line < line) {
        ++formatter->line_annotation_index;
    }

    if (formatter->line_annotation_index < line_annotations.len &&
        line_annotations[formatter->line_annotation_index].doc_line == line) {
        return line_annotations[formatter->line_annotation_index].virtual_rows;
    }
    return 0;
}

bool Document_Formatter::next(Formatted_Grapheme* grapheme) {
    if (done) {
        return false;
    }

    skip_concealed_spans(this);

    char ch = '\n';
    size_t width = 1;
    if (position < text.len) {
        ch = text[position];
        width = char_visual_columns(*format, ch, column) - column;
    }

    if (format->soft_wrap && column > 0 && column + width > format->viewport_width) {
        ++row;
        column = 0;
        if (position < text.len) {
            width = char_visual_columns(*format, ch, column);
        }
    }

    grapheme->char_idx = position;
    grapheme->visual_pos = {row, column};
    grapheme->width = width;
    grapheme_line = line;

    // The end of the text gets a final blank grapheme so the caret can be placed after it.
    if (position >= text.len) {
        grapheme->raw = {};
        done = true;
        return true;
    }

    if (ch == '\n') {
        grapheme->raw = {};
    } else if (ch == '\t' || cz::is_print(ch)) {
        grapheme->raw = text.slice(position, position + 1);
    } else {
        int len = snprintf(escape, sizeof(escape), "\\[%u;", (unsigned)(unsigned char)ch);
        CZ_ASSERT(len > 0);
        grapheme->raw = {escape, (size_t)len};
    }

    ++position;
    if (ch == '\n') {
        row += 1 + reserved_virtual_rows(this, line);
        column = 0;
        ++line;
    } else {
        column += width;
    }
    return true;
}

}
