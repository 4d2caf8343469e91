#pragma once
#include <optional>
#include <string>

// Drops trailing separators; "/" stays "/".
std::string normalize_root(const std::string& path);

// True when path equals root or lies below it at a separator boundary.
bool path_is_under(const std::string& root, const std::string& path);

// path with the root prefix and its separator removed; nullopt when outside.
std::optional<std::string> relative_to_root(const std::string& root, const std::string& path);

std::string join_path(const std::string& dir, const std::string& name);
