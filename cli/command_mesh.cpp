#include "cli_common.hpp"
#include <geometry/tube_builder.hpp>
#include <export/export_format.hpp>
#include <export/glb_exporter.hpp>
#include <export/obj_exporter.hpp>
#include <common/logging.hpp>

namespace branchmesh::cli {

namespace {
constexpr const char* USAGE =
    "Usage: branchmesh mesh <skeleton.json> [-o out.obj|out.glb] "
    "[-c config.json] [-r resolution]\n";
}

int command_mesh(int argc, char** argv) {
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
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".obj", ctx.output_path);
        auto format = export_format_from_path(output_path);
        if (!format) {
            throw std::runtime_error("Cannot infer export format from: " + output_path);
        }

        log->info("Meshing skeleton: {}", ctx.input_path);
        RunConfig config = load_run_config(ctx);
        Skeleton skeleton = load_skeleton(ctx.input_path);
        log->debug("Loaded {} strands, {} points", skeleton.strands.size(), skeleton.point_count());

        MeshBuckets buckets = build_tube_meshes(skeleton, config.tube);

        size_t vertex_total = 0;
        size_t triangle_total = 0;
        for (const auto& [id, bucket] : buckets) {
            vertex_total += bucket.vertex_count();
            triangle_total += bucket.triangle_count();
        }

        size_t bytes_written = 0;
        if (*format == ExportFormat::Glb) {
            std::vector<uint8_t> glb = meshes_to_glb(buckets, config.materials);
            json::write_binary_file(output_path, glb);
            bytes_written = glb.size();
        } else {
            std::ostringstream obj;
            obj << "# branchmesh OBJ Export\n";
            obj << "# Source: " << ctx.input_path << "\n";
            obj << "# Materials: " << buckets.size() << "\n\n";
            obj << meshes_to_obj(buckets, config.base_name);
            std::string text = obj.str();
            write_file(output_path, text);
            bytes_written = text.size();
        }

        log->info("Wrote {} to {}", export_format_name(*format), output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << buckets.size() << " materials, "
                  << vertex_total << " vertices, "
                  << triangle_total << " triangles, "
                  << bytes_written << " bytes)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace branchmesh::cli
