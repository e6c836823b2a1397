#include "furnace/fsutil.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace furnace {

std::string read_file(const std::filesystem::path& p, std::string* out) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return "cannot open " + p.filename().string();
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) return "read failed: " + p.filename().string();
    if (out) *out = oss.str();
    return "";
}

std::string write_atomic(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.filename().string();
        f << body;
        f.flush();
        if (!f) return "short write " + tmp.filename().string();
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code rec;
        std::filesystem::remove(tmp, rec);
        return "rename failed: " + ec.message();
    }
    return "";
}

std::string copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::error_code ec;
    std::filesystem::create_directories(dst, ec);
    if (ec) return "mkdir failed: " + ec.message();
    std::filesystem::copy(src, dst,
                          std::filesystem::copy_options::recursive |
                          std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) return "copy failed: " + ec.message();
    return "";
}

} // namespace furnace
