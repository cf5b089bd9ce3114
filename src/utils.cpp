#include "utils.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string relative_key(const std::filesystem::path& relative){
    return relative.lexically_normal().generic_string();
}

std::filesystem::path normalize_root(const std::filesystem::path& root){
    auto out = std::filesystem::absolute(root).lexically_normal();
    if(!out.has_filename() && out != out.root_path()) out = out.parent_path();
    return out;
}

bool is_unsigned_integer(const std::string& text){
    if(text.empty()) return false;
    for(unsigned char c: text){
        if(!std::isdigit(c)) return false;
    }
    return true;
}
