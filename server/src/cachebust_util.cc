#include "cachebust_util.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <limits.h>
#include <unistd.h>

namespace cachebust {

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return lower_ascii(s.substr(s.size() - suffix.size())) == lower_ascii(suffix);
}

// Only a single leading separator is removed: "//x" is not a logical path.
std::string strip_leading_slash(const std::string& p) {
    if (!p.empty() && p[0] == '/') return p.substr(1);
    return p;
}

std::string trim_slashes(std::string s) {
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

std::string to_logical_path(const std::string& native_rel) {
    std::string s = native_rel;
    std::replace(s.begin(), s.end(), '\\', '/');
    if (starts_with(s, "./")) s.erase(0, 2);
    return trim_slashes(s);
}

bool read_file_to_string(const std::string& path, std::string& out, std::string* err) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        if (err) *err = "read failed: " + path;
        return false;
    }
    out = ss.str();
    return true;
}

// tmp + rename, so readers never observe a partially written file.
bool write_file_atomic(const std::string& path, const std::string& body, std::string* err) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            if (err) *err = "create_directories failed: " + ec.message();
            return false;
        }
    }

    auto tmp = p;
    tmp += ".tmp." + std::to_string((long)::getpid());

    {
        std::ofstream out(tmp.string(), std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            if (err) *err = "cannot open " + tmp.string();
            return false;
        }
        out.write(body.data(), (std::streamsize)body.size());
        out.flush();
        if (!out.good()) {
            if (err) *err = "write failed: " + tmp.string();
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        if (err) *err = "rename failed: " + ec.message();
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return false;
    }
    return true;
}

std::string exe_dir() {
    char buf[PATH_MAX] = {0};
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string p(buf, (size_t)n);
    return std::filesystem::path(p).parent_path().string();
}

} // namespace cachebust
