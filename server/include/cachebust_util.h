#pragma once
#include <string>

namespace cachebust {

    std::string now_iso_utc();
    std::string lower_ascii(std::string s);

    bool starts_with(const std::string& s, const std::string& prefix);
    bool ends_with_ci(const std::string& s, const std::string& suffix);

    // Path helpers for logical asset paths ("css/app.css", no leading '/').
    std::string strip_leading_slash(const std::string& p);
    std::string trim_slashes(std::string s);
    std::string to_logical_path(const std::string& native_rel);

    // Whole-file read/write. Return false and fill *err on failure.
    bool read_file_to_string(const std::string& path, std::string& out, std::string* err = nullptr);
    bool write_file_atomic(const std::string& path, const std::string& body, std::string* err = nullptr);

    // Directory containing the running executable.
    std::string exe_dir();

} // namespace cachebust
