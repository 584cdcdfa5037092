#include <czt/test_base.hpp>

#include "core/decoration.hpp"
#include "decorations/decoration_inline_diagnostics.hpp"
#include "test_runner.hpp"

using namespace drape;
using decorations::Diagnostic;
using decorations::Severity;

TEST_CASE("decoration_inline_diagnostics draws messages below the line") {
    Test_Runner tr(30, 6);
    const Diagnostic diagnostics[] = {
        {8, Severity::ERROR, "undeclared"},
        {4, Severity::WARNING, "unused"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    const Line_Annotation line_annotations[] = {{0, 2}};
    Text_Annotations annotations = {};
    annotations.line_annotations = line_annotations;
    tr.render("int x = y;\nreturn;", 0, annotations);

    CHECK(tr.stringify() ==
          "int x = y;\n"
          "        ^ undeclared\n"
          "    ^ unused\n"
          "return;");
    CHECK(tr.face_at(1, 8) == tr.theme.special_faces[Face_Type::DIAGNOSTIC_ERROR]);
    CHECK(tr.face_at(1, 10) == tr.theme.special_faces[Face_Type::DIAGNOSTIC_ERROR]);
    CHECK(tr.face_at(2, 4) == tr.theme.special_faces[Face_Type::DIAGNOSTIC_WARNING]);
}

TEST_CASE("decoration_inline_diagnostics stops at the bottom of the viewport") {
    Test_Runner tr(30, 2);
    const Diagnostic diagnostics[] = {
        {4, Severity::WARNING, "unused"},
        {8, Severity::ERROR, "undeclared"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    tr.render("int x = y;");

    CHECK(tr.stringify() ==
          "int x = y;\n"
          "        ^ undeclared");
}

TEST_CASE("decoration_inline_diagnostics drops concealed diagnostics") {
    Test_Runner tr(30, 4);
    const Diagnostic diagnostics[] = {
        {2, Severity::ERROR, "concealed"},
        {5, Severity::INFO, "five"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    const Concealed_Span spans[] = {{1, 4}};
    const Line_Annotation line_annotations[] = {{0, 1}};
    Text_Annotations annotations = {};
    annotations.concealed_spans = spans;
    annotations.line_annotations = line_annotations;
    tr.render("abcdef", 0, annotations);

    CHECK(tr.stringify() ==
          "aef\n"
          "  ^ five");
    CHECK(tr.face_at(1, 2) == tr.theme.special_faces[Face_Type::DIAGNOSTIC_INFO]);
}

TEST_CASE("decoration_inline_diagnostics ignores diagnostics before the first visible character") {
    Test_Runner tr(30, 4);
    const Diagnostic diagnostics[] = {
        {1, Severity::HINT, "one"},
        {4, Severity::HINT, "four"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    const Line_Annotation line_annotations[] = {{1, 1}};
    Text_Annotations annotations = {};
    annotations.line_annotations = line_annotations;
    tr.render("ab\ncd", 3, annotations);

    CHECK(tr.stringify() ==
          "cd\n"
          " ^ four");
}

TEST_CASE("decoration_inline_diagnostics hides diagnostics scrolled out of view") {
    Test_Runner tr(10, 3);
    tr.format.soft_wrap = false;
    tr.renderer.col_offset = 5;
    const Diagnostic diagnostics[] = {
        {2, Severity::ERROR, "hidden"},
        {7, Severity::ERROR, "seen"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    tr.render("0123456789abc");

    CHECK(tr.stringify() ==
          "56789abc\n"
          "  ^ seen");
}

TEST_CASE("decoration_inline_diagnostics attach to the visual line they are on") {
    Test_Runner tr(4, 6);
    const Diagnostic diagnostics[] = {
        {5, Severity::ERROR, "e"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    const Line_Annotation line_annotations[] = {{0, 1}};
    Text_Annotations annotations = {};
    annotations.line_annotations = line_annotations;
    tr.render("abcdef\nx", 0, annotations);

    CHECK(tr.stringify() ==
          "abcd\n"
          "ef\n"
          " ^ e\n"
          "x");
}

TEST_CASE("decoration_inline_diagnostics draws each line of a message on its own row") {
    Test_Runner tr(30, 6);
    const Diagnostic diagnostics[] = {
        {0, Severity::WARNING, "w"},
        {4, Severity::ERROR, "undeclared\nsee here"},
    };
    tr.manager.add_decoration(decorations::decoration_inline_diagnostics(diagnostics, tr.theme));

    tr.render("x = y;");

    CHECK(tr.stringify() ==
          "x = y;\n"
          "    ^ undeclared\n"
          "      see here\n"
          "^ w");
    CHECK(tr.face_at(2, 6) == tr.theme.special_faces[Face_Type::DIAGNOSTIC_ERROR]);
    CHECK(tr.face_at(3, 0) == tr.theme.special_faces[Face_Type::DIAGNOSTIC_WARNING]);
}

TEST_CASE("decoration_inline_diagnostics counts only the message rows that fit") {
    Test_Runner tr(30, 4);
    const Diagnostic diagnostics[] = {
        {0, Severity::ERROR, "a\nb\nc"},
    };
    Decoration decoration = decorations::decoration_inline_diagnostics(diagnostics, tr.theme);
    tr.manager.add_decoration(decoration);

    tr.manager.prepare_for_rendering(0);
    tr.manager.decorate_grapheme(&tr.renderer, test_grapheme(0));

    CHECK(decoration.render_virt_lines(&tr.renderer, {0, 0, 0}, 2) == 2);
    CHECK(tr.stringify() ==
          "\n"
          "\n"
          "^ a\n"
          "  b");
}
