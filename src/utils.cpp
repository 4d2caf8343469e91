#include "utils.hpp"

std::string normalize_root(const std::string& path){
    std::string out = path;
    while(out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool path_is_under(const std::string& root, const std::string& path){
    return relative_to_root(root, path).has_value();
}

std::optional<std::string> relative_to_root(const std::string& root, const std::string& path){
    std::string base = normalize_root(root);
    if(base.empty()) return std::nullopt;
    if(path.compare(0, base.size(), base) != 0) return std::nullopt;
    if(path.size() == base.size()) return std::string();
    if(base == "/") return path.substr(1);
    if(path[base.size()] != '/') return std::nullopt; // "/a/b" vs "/a/bc"
    std::string rest = path.substr(base.size() + 1);
    while(!rest.empty() && rest.front() == '/') rest.erase(0, 1);
    return rest;
}

std::string join_path(const std::string& dir, const std::string& name){
    if(dir.empty()) return name;
    if(dir.back() == '/') return dir + name;
    return dir + "/" + name;
}
