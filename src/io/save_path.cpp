/// @file save_path.cpp
/// @brief Default names and extensions for exported images

#include "io/save_path.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace contextviz {

std::string default_file_name(const std::string& title) {
    std::string name;
    bool pending_sep = false;
    for (char c : title) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_sep && !name.empty()) {
                name += '_';
            }
            name += static_cast<char>(std::tolower(uc));
            pending_sep = false;
        } else {
            pending_sep = true;
        }
    }
    if (name.empty()) {
        name = "visualization";
    }
    return name + ".png";
}

std::string default_save_path(const std::string& title) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::current_path(ec);
    if (ec) {
        return default_file_name(title);
    }
    return (dir / default_file_name(title)).string();
}

std::string with_png_extension(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.has_filename() && !p.has_extension()) {
        return path + ".png";
    }
    return path;
}

} // namespace contextviz
