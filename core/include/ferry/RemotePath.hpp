// Helpers for remote (always POSIX) paths.
#pragma once
#include <string>

namespace ferry {

// "~" and "" -> "." (session working directory, i.e. the user's home on a
// fresh session); a leading "~/" is stripped; anything else is unchanged.
std::string normalizeRemotePath(const std::string& path);

// POSIX join: joinRemotePath("/home/a", "x") == "/home/a/x".
std::string joinRemotePath(const std::string& base, const std::string& name);

// Last path component ("/a/b/" -> "b", "/" -> "/").
std::string remoteBaseName(const std::string& path);

// Parent directory ("/a/b" -> "/a", "/a" -> "/", "b" -> "").
std::string remoteParent(const std::string& path);

inline bool isAbsoluteRemotePath(const std::string& path) {
    return !path.empty() && path.front() == '/';
}

} // namespace ferry
