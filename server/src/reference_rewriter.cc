#include "reference_rewriter.h"
#include "cachebust_util.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace cachebust {

namespace {

// [begin, end) of one reference inside the stylesheet text, quotes excluded.
struct Span {
    size_t begin;
    size_t end;
};

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

bool is_ident_char(char c) {
    return std::isalnum((unsigned char)c) || c == '-' || c == '_';
}

size_t find_ci(const std::string& s, const std::string& needle, size_t from) {
    if (needle.empty() || s.size() < needle.size()) return std::string::npos;
    for (size_t i = from; i + needle.size() <= s.size(); i++) {
        size_t k = 0;
        while (k < needle.size() &&
               std::tolower((unsigned char)s[i + k]) == std::tolower((unsigned char)needle[k])) {
            k++;
        }
        if (k == needle.size()) return i;
    }
    return std::string::npos;
}

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && is_ws(s[b])) b++;
    while (e > b && is_ws(s[e - 1])) e--;
    return s.substr(b, e - b);
}

void scan_url_refs(const std::string& css, std::vector<Span>& out) {
    size_t pos = 0;
    while ((pos = find_ci(css, "url(", pos)) != std::string::npos) {
        size_t i = pos + 4;
        if (pos > 0 && is_ident_char(css[pos - 1])) { pos = i; continue; }

        while (i < css.size() && is_ws(css[i])) i++;
        if (i >= css.size()) return;

        if (css[i] == '"' || css[i] == '\'') {
            const char q = css[i];
            const size_t b = i + 1;
            const size_t e = css.find(q, b);
            if (e == std::string::npos) return;
            out.push_back(Span{b, e});
            pos = e + 1;
        } else {
            const size_t e = css.find(')', i);
            if (e == std::string::npos) return;
            size_t t = e;
            while (t > i && is_ws(css[t - 1])) t--;
            out.push_back(Span{i, t});
            pos = e + 1;
        }
    }
}

// Only the string form; "@import url(...)" is already covered by scan_url_refs.
void scan_imports(const std::string& css, std::vector<Span>& out) {
    size_t pos = 0;
    while ((pos = find_ci(css, "@import", pos)) != std::string::npos) {
        size_t i = pos + 7;
        while (i < css.size() && is_ws(css[i])) i++;
        if (i < css.size() && (css[i] == '"' || css[i] == '\'')) {
            const char q = css[i];
            const size_t b = i + 1;
            const size_t e = css.find(q, b);
            if (e == std::string::npos) return;
            out.push_back(Span{b, e});
            pos = e + 1;
        } else {
            pos = i;
        }
    }
}

void scan_source_maps(const std::string& css, std::vector<Span>& out) {
    static const std::string kKey = "sourceMappingURL=";
    size_t pos = 0;
    while ((pos = css.find(kKey, pos)) != std::string::npos) {
        const size_t b = pos + kKey.size();
        size_t e = b;
        while (e < css.size() && !is_ws(css[e]) && css.compare(e, 2, "*/") != 0) e++;
        if (e > b) out.push_back(Span{b, e});
        pos = e;
    }
}

bool is_absolute_url(const std::string& r) {
    if (r.empty() || r[0] == '#') return true;
    if (starts_with(r, "//")) return true;
    const size_t colon = r.find(':');
    const size_t stop = r.find_first_of("/?#");
    return colon != std::string::npos && (stop == std::string::npos || colon < stop);
}

} // namespace

bool ReferenceRewriter::normalize_logical(const std::string& path, std::string* out) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        const std::string seg = path.substr(pos, next - pos);
        if (seg == "..") {
            if (parts.empty()) return false;
            parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        pos = next + 1;
    }
    if (parts.empty()) return false;

    std::string s;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) s += '/';
        s += parts[i];
    }
    *out = s;
    return true;
}

bool ReferenceRewriter::resolve_reference(const std::string& ref,
                                          const std::string& base_dir,
                                          const NameMap& known,
                                          std::string* out_ref) {
    const std::string r = trim_ws(ref);
    if (is_absolute_url(r)) return false;

    const size_t q = r.find_first_of("?#");
    const std::string path = r.substr(0, q);
    const std::string suffix = (q == std::string::npos) ? "" : r.substr(q);
    if (path.empty()) return false;

    const bool root_relative = path[0] == '/';
    std::string joined;
    if (root_relative)          joined = path.substr(1);
    else if (base_dir.empty())  joined = path;
    else                        joined = base_dir + "/" + path;

    std::string logical;
    if (!normalize_logical(joined, &logical)) return false;

    auto it = known.find(logical);
    if (it == known.end()) return false;
    const std::string& fp_logical = it->second;

    if (root_relative) {
        *out_ref = "/" + fp_logical + suffix;
        return true;
    }

    // The fingerprinted file sits next to the original, so only the last
    // segment of the written reference changes.
    const size_t fp_slash = fp_logical.rfind('/');
    const std::string fp_name = (fp_slash == std::string::npos) ? fp_logical : fp_logical.substr(fp_slash + 1);
    const size_t slash = path.rfind('/');
    *out_ref = (slash == std::string::npos ? std::string() : path.substr(0, slash + 1)) + fp_name + suffix;
    return true;
}

namespace {

std::vector<Span> scan_all(const std::string& css) {
    std::vector<Span> spans;
    scan_url_refs(css, spans);
    scan_imports(css, spans);
    scan_source_maps(css, spans);
    std::sort(spans.begin(), spans.end(),
              [](const Span& a, const Span& b){ return a.begin < b.begin; });
    return spans;
}

std::string base_dir_of(const std::string& stylesheet_logical_path) {
    const std::string logical = strip_leading_slash(stylesheet_logical_path);
    const size_t slash = logical.rfind('/');
    return (slash == std::string::npos) ? "" : logical.substr(0, slash);
}

} // namespace

std::vector<std::string> ReferenceRewriter::targets(const std::string& css,
                                                    const std::string& stylesheet_logical_path) {
    const std::string base_dir = base_dir_of(stylesheet_logical_path);
    std::vector<std::string> out;
    size_t cursor = 0;
    for (const auto& sp : scan_all(css)) {
        if (sp.begin < cursor) continue;
        cursor = sp.end;

        const std::string r = trim_ws(css.substr(sp.begin, sp.end - sp.begin));
        if (is_absolute_url(r)) continue;
        const std::string path = r.substr(0, r.find_first_of("?#"));
        if (path.empty()) continue;

        const std::string joined = (path[0] == '/') ? path.substr(1)
                                 : base_dir.empty() ? path
                                 : base_dir + "/" + path;
        std::string logical;
        if (normalize_logical(joined, &logical)) out.push_back(logical);
    }
    return out;
}

RewriteResult ReferenceRewriter::rewrite(const std::string& css,
                                         const std::string& stylesheet_logical_path,
                                         const NameMap& known) {
    const std::vector<Span> spans = scan_all(css);
    const std::string base_dir = base_dir_of(stylesheet_logical_path);

    RewriteResult res;
    res.text.reserve(css.size() + spans.size() * 9);

    size_t cursor = 0;
    for (const auto& sp : spans) {
        if (sp.begin < cursor) continue; // overlapping match

        res.text.append(css, cursor, sp.begin - cursor);

        const std::string ref = css.substr(sp.begin, sp.end - sp.begin);
        std::string replacement;
        if (resolve_reference(ref, base_dir, known, &replacement)) {
            // Whitespace inside the quotes is kept; only the name changes.
            size_t lead = 0, trail = ref.size();
            while (lead < trail && is_ws(ref[lead])) lead++;
            while (trail > lead && is_ws(ref[trail - 1])) trail--;
            res.text.append(ref, 0, lead);
            res.text += replacement;
            res.text.append(ref, trail, std::string::npos);
            res.replaced++;
        } else {
            res.text += ref;
            if (!is_absolute_url(trim_ws(ref))) res.unresolved++;
        }
        cursor = sp.end;
    }
    res.text.append(css, cursor, std::string::npos);
    return res;
}

} // namespace cachebust
