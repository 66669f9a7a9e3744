#include "ferry/RemotePath.hpp"

namespace ferry {

std::string normalizeRemotePath(const std::string& path) {
    if (path.empty() || path == "~")
        return ".";
    if (path.rfind("~/", 0) == 0) {
        const std::string rest = path.substr(2);
        return rest.empty() ? std::string(".") : rest;
    }
    return path;
}

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty() || base == ".")
        return name;
    if (name.empty())
        return base;
    if (base.back() == '/')
        return base + (name.front() == '/' ? name.substr(1) : name);
    return base + (name.front() == '/' ? name : "/" + name);
}

std::string remoteBaseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const std::size_t cut = p.rfind('/');
    if (cut == std::string::npos || p == "/")
        return p;
    return p.substr(cut + 1);
}

std::string remoteParent(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const std::size_t cut = p.rfind('/');
    if (cut == std::string::npos)
        return {};
    if (cut == 0)
        return "/";
    return p.substr(0, cut);
}

} // namespace ferry
