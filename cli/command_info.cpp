#include "cli_common.hpp"
#include <export/glb_exporter.hpp>
#include <common/logging.hpp>

namespace branchmesh::cli {

namespace {
constexpr const char* USAGE =
    "Usage: branchmesh info <model.glb>\n";
}

// Print a summary of a GLB container
int command_info(int argc, char** argv) {
    auto log = branchmesh::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            std::cout << USAGE;
            return 0;
        }

        if (ctx.input_path.empty()) {
            std::cerr << USAGE;
            return 1;
        }

        log->info("Reading GLB: {}", ctx.input_path);
        std::vector<uint8_t> bytes = json::read_binary_file(ctx.input_path);
        GlbContents glb = read_glb(bytes);

        const nlohmann::json& doc = glb.json;
        auto count = [&](const char* key) -> size_t {
            return doc.contains(key) ? doc[key].size() : 0;
        };

        std::cout << ctx.input_path << ": " << bytes.size() << " bytes\n";
        std::string generator = doc.contains("asset") ? doc["asset"].value("generator", "unknown")
                                                      : "unknown";
        std::cout << "  generator: " << generator << "\n";
        std::cout << "  meshes:    " << count("meshes") << "\n";
        std::cout << "  materials: " << count("materials") << "\n";
        std::cout << "  accessors: " << count("accessors") << "\n";
        std::cout << "  binary:    " << glb.bin.size() << " bytes\n";

        if (doc.contains("materials")) {
            for (const auto& material : doc["materials"]) {
                std::cout << "    " << material.value("name", "?") << " "
                          << material.value("pbrMetallicRoughness", nlohmann::json::object()).dump()
                          << "\n";
            }
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace branchmesh::cli
