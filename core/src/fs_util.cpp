#include "conjure/fs_util.h"
#include "conjure/hash.h"

#include <ctime>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace conjure {

bool slurp_file(const std::filesystem::path& p, std::string* out) {
    std::ifstream f(p.string(), std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (out) *out = ss.str();
    return true;
}

std::string write_atomic(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp-" + std::to_string((long long)getpid()) + "-" + hash::random_hex(4);
    {
        std::ofstream f(tmp.string(), std::ios::binary);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        f.flush();
        if (!f) {
            f.close();
            std::filesystem::remove(tmp, ec);
            return "short write " + tmp.string();
        }
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return "rename failed: " + ec.message();
    }
    return "";
}

std::string quarantine_corrupt_file(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return "";

    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm);

    auto dst = p;
    dst += std::string(".corrupt-") + stamp;
    std::filesystem::rename(p, dst, ec);
    if (ec) return "";
    return dst.string();
}

} // namespace conjure
