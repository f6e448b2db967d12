#include "cli_common.hpp"
#include <collider/collider_builder.hpp>
#include <serialization/collider_json.hpp>
#include <common/logging.hpp>

namespace branchmesh::cli {

namespace {
constexpr const char* USAGE =
    "Usage: branchmesh colliders <skeleton.json> [-o colliders.json] "
    "[-c config.json] [--min-radius r]\n";
}

int command_colliders(int argc, char** argv) {
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

        std::string output_path = resolve_output_path(ctx.input_path, ".colliders.json",
                                                      ctx.output_path);

        log->info("Building colliders for: {}", ctx.input_path);
        RunConfig config = load_run_config(ctx);
        Skeleton skeleton = load_skeleton(ctx.input_path);

        std::vector<PositionedCollider> parts = build_collider_parts(skeleton, config.collider);

        size_t capsules = 0;
        for (const auto& part : parts) {
            if (std::holds_alternative<shape::Capsule>(part.shape)) {
                ++capsules;
            }
        }

        json::SerializedData output;
        output.step = "colliders";
        output.timestamp = json::get_timestamp();
        output.source_file = ctx.input_path;
        output.config = config.collider;
        output.stats = {
            {"colliders", parts.size()},
            {"capsules", capsules},
            {"spheres", parts.size() - capsules}
        };
        output.data = colliders_to_json(parts);
        if (auto compound = make_compound(parts)) {
            output.data.update(compound_to_json(*compound));
        }

        json::write_serialized(output_path, output);

        log->info("Wrote {} colliders to {}", parts.size(), output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << capsules << " capsules, "
                  << (parts.size() - capsules) << " spheres)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace branchmesh::cli
