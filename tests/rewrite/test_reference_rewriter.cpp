// tests/rewrite/test_reference_rewriter.cpp
//
// Stylesheet reference rewriting:
// - url() in all quoting forms, @import strings, sourceMappingURL
// - relative, "../" and root-relative references
// - repeated references rewritten consistently
// - unknown, absolute and data: references left exactly as written

#include <cstdio>
#include <string>
#include <vector>

#include "reference_rewriter.h"

using namespace cachebust;

static int failures = 0;

static void expect_eq(const char* name, const std::string& got, const std::string& want) {
    if (got == want) return;
    std::fprintf(stderr, "[%s] FAIL:\n  got:  %s\n  want: %s\n", name, got.c_str(), want.c_str());
    failures++;
}

static void expect_true(const char* name, bool cond) {
    if (cond) return;
    std::fprintf(stderr, "[%s] FAIL\n", name);
    failures++;
}

int main() {
    const NameMap known = {
        {"images/logo.png", "images/logo.0a1b2c3d.png"},
        {"css/base.css", "css/base.11112222.css"},
        {"css/app.css.map", "css/app.css.33334444.map"},
        {"css/fonts/x.woff2", "css/fonts/x.55556666.woff2"},
    };

    // Quoting forms
    {
        const std::string css =
            "a{background:url(../images/logo.png)}\n"
            "b{background:url('../images/logo.png')}\n"
            "c{background:url( \"../images/logo.png\" )}\n";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "css/app.css", known);
        expect_eq("quotes",
                  r.text,
                  "a{background:url(../images/logo.0a1b2c3d.png)}\n"
                  "b{background:url('../images/logo.0a1b2c3d.png')}\n"
                  "c{background:url( \"../images/logo.0a1b2c3d.png\" )}\n");
        expect_true("quotes_count", r.replaced == 3 && r.unresolved == 0);
    }

    // @import, root-relative, source map
    {
        const std::string css =
            "@import \"base.css\";\n"
            "@import url(base.css);\n"
            ".logo{background:url(/images/logo.png)}\n"
            "/*# sourceMappingURL=app.css.map */\n";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "/css/app.css", known);
        expect_eq("import_map",
                  r.text,
                  "@import \"base.11112222.css\";\n"
                  "@import url(base.11112222.css);\n"
                  ".logo{background:url(/images/logo.0a1b2c3d.png)}\n"
                  "/*# sourceMappingURL=app.css.33334444.map */\n");
        expect_true("import_map_count", r.replaced == 4);
    }

    // Query and fragment survive
    {
        const std::string css = "@font-face{src:url(fonts/x.woff2?v=3#iefix)}";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "css/app.css", known);
        expect_eq("suffix", r.text, "@font-face{src:url(fonts/x.55556666.woff2?v=3#iefix)}");
    }

    // Untouched references
    {
        const std::string css =
            "a{background:url(https://cdn.example.com/images/logo.png)}\n"
            "b{background:url(//cdn.example.com/logo.png)}\n"
            "c{background:url(data:image/png;base64,iVBORw0KGgo=)}\n"
            "d{filter:url(#shadow)}\n"
            "e{background:url(../images/unknown.png)}\n"
            "f{background:url(../../outside.png)}\n";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "css/app.css", known);
        expect_eq("untouched", r.text, css);
        expect_true("untouched_count", r.replaced == 0);
        expect_true("untouched_unresolved", r.unresolved == 2);
    }

    // Whitespace inside quotes survives the rewrite
    {
        const std::string css = "a{background:url(\" ../images/logo.png \")}";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "css/app.css", known);
        expect_eq("quoted_ws", r.text, "a{background:url(\" ../images/logo.0a1b2c3d.png \")}");
        expect_true("quoted_ws_count", r.replaced == 1);
    }

    // Identifier ending in "url(" is not a reference
    {
        const std::string css = "a{x:myurl(../images/logo.png)}";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "css/app.css", known);
        expect_eq("ident_prefix", r.text, css);
    }

    // Repeated references are rewritten the same way every time
    {
        const std::string css =
            "a{background:url(../images/logo.png)}"
            "b{background:url(../images/logo.png)}"
            "c{background:url(/images/logo.png)}";
        const RewriteResult r = ReferenceRewriter::rewrite(css, "css/app.css", known);
        expect_eq("repeat",
                  r.text,
                  "a{background:url(../images/logo.0a1b2c3d.png)}"
                  "b{background:url(../images/logo.0a1b2c3d.png)}"
                  "c{background:url(/images/logo.0a1b2c3d.png)}");
        expect_true("repeat_count", r.replaced == 3);
    }

    // Stylesheet at the public root
    {
        const NameMap top = {{"logo.png", "logo.abcdef01.png"}};
        const RewriteResult r = ReferenceRewriter::rewrite("x{background:url(./logo.png)}", "site.css", top);
        expect_eq("root_sheet", r.text, "x{background:url(./logo.abcdef01.png)}");
    }

    // Normalization
    {
        std::string out;
        expect_true("norm_ok", ReferenceRewriter::normalize_logical("css/../img/./a.png", &out));
        expect_eq("norm", out, "img/a.png");
        expect_true("norm_escape", !ReferenceRewriter::normalize_logical("../a.png", &out));
    }

    // Targets
    {
        const std::string css =
            "@import 'base.css';\n"
            "a{background:url(/images/logo.png)}\n"
            "b{background:url(https://example.com/x.png)}\n";
        const std::vector<std::string> t = ReferenceRewriter::targets(css, "css/app.css");
        expect_true("targets_size", t.size() == 2);
        if (t.size() == 2) {
            expect_eq("targets_0", t[0], "css/base.css");
            expect_eq("targets_1", t[1], "images/logo.png");
        }
    }

    if (failures) {
        std::fprintf(stderr, "[reference_rewriter] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("OK: reference rewriter tests passed\n");
    return 0;
}
