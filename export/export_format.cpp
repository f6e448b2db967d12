#include "export_format.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace branchmesh {

const char* export_format_name(ExportFormat format) {
    switch (format) {
        case ExportFormat::Obj: return "OBJ";
        case ExportFormat::Glb: return "GLB";
    }
    return "OBJ";
}

const char* export_format_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Obj: return "obj";
        case ExportFormat::Glb: return "glb";
    }
    return "obj";
}

std::optional<ExportFormat> export_format_from_path(const std::string& path) {
    size_t dot_pos = path.find_last_of('.');
    size_t slash_pos = path.find_last_of('/');
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos)) {
        return std::nullopt;
    }

    std::string ext = path.substr(dot_pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (ExportFormat format : {ExportFormat::Obj, ExportFormat::Glb}) {
        if (ext == export_format_extension(format)) {
            return format;
        }
    }
    return std::nullopt;
}

}  // namespace branchmesh
