#ifndef BRANCHMESH_EXPORT_EXPORT_FORMAT_HPP
#define BRANCHMESH_EXPORT_EXPORT_FORMAT_HPP

#include <optional>
#include <string>

namespace branchmesh {

enum class ExportFormat {
    Obj,
    Glb
};

const char* export_format_name(ExportFormat format);
const char* export_format_extension(ExportFormat format);

// Pick the format from a file name's extension (case-insensitive)
std::optional<ExportFormat> export_format_from_path(const std::string& path);

}  // namespace branchmesh

#endif // BRANCHMESH_EXPORT_EXPORT_FORMAT_HPP
