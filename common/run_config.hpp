#ifndef BRANCHMESH_COMMON_RUN_CONFIG_HPP
#define BRANCHMESH_COMMON_RUN_CONFIG_HPP

#include <geometry/tube_builder.hpp>
#include <collider/collider_builder.hpp>
#include <materials/material_settings.hpp>
#include <string>

namespace branchmesh {

// Everything a command line run can be configured with
struct RunConfig {
    TubeMeshConfig tube;
    ColliderConfig collider;
    std::string base_name = "lsystem";     // OBJ object name prefix
    MaterialSettingsMap materials = default_material_palette();
};

}  // namespace branchmesh

#endif // BRANCHMESH_COMMON_RUN_CONFIG_HPP
