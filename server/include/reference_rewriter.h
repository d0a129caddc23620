#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cachebust {

// logical path -> fingerprinted logical path
using NameMap = std::map<std::string, std::string>;

struct RewriteResult {
    std::string text;
    std::size_t replaced = 0;    // references rewritten
    std::size_t unresolved = 0;  // relative references with no known target
};

// ReferenceRewriter
// =================
//
// Rewrites the references inside one stylesheet so they point at fingerprinted
// names. Handled forms:
//
//   url(img/logo.png)   url('img/logo.png')   url("img/logo.png")
//   @import "base.css";  @import 'base.css';
//   /*# sourceMappingURL=app.css.map */
//
// References are resolved against the stylesheet's own logical directory ("./"
// and "../" included) or, when they start with '/', against the public root.
// Only targets present in `known` are rewritten; everything else is left exactly
// as written. Absolute URLs (scheme:, //host, data:, #id) are never touched.
class ReferenceRewriter {
public:
    static RewriteResult rewrite(const std::string& css,
                                 const std::string& stylesheet_logical_path,
                                 const NameMap& known);

    // Resolves a single reference as rewrite() would. False if it stays as-is.
    static bool resolve_reference(const std::string& ref,
                                  const std::string& base_dir,
                                  const NameMap& known,
                                  std::string* out_ref);

    // Logical paths of every relative or root-relative reference, in order of
    // appearance. Used to rewrite a stylesheet after the ones it imports.
    static std::vector<std::string> targets(const std::string& css,
                                            const std::string& stylesheet_logical_path);

    // "css/../img/./a.png" -> "img/a.png". False if ".." leaves the root.
    static bool normalize_logical(const std::string& path, std::string* out);
};

} // namespace cachebust
