// Copyright 2025 Enactic, Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <armkin/config/kinematics_config.hpp>
#include <filesystem>
#include <stdexcept>

namespace armkin {

namespace {

constexpr const char* ROBOT = "robot";
constexpr const char* SOLVER = "solver";
constexpr const char* JOINT_STATE = "joint_state";

void read_optional(const YamlLoader& loader, const char* key, int& value) {
    if (loader.has(SOLVER, key)) value = loader.get_int(SOLVER, key);
}

void read_optional(const YamlLoader& loader, const char* key, double& value) {
    if (loader.has(SOLVER, key)) value = loader.get_double(SOLVER, key);
}

std::vector<double> read_state_vector(const YamlLoader& loader, const char* key, size_t size) {
    if (!loader.has(JOINT_STATE, key)) {
        return std::vector<double>(size, 0.0);
    }
    std::vector<double> values = loader.get_vector(JOINT_STATE, key);
    if (values.size() != size) {
        throw std::runtime_error(std::string("joint_state.") + key + " has " +
                                 std::to_string(values.size()) + " entries, expected " +
                                 std::to_string(size));
    }
    return values;
}

}  // namespace

KinematicsConfig KinematicsConfig::load(const std::string& path) {
    YamlLoader loader(path);
    const std::string base_dir = std::filesystem::path(path).parent_path().string();
    return from_loader(loader, base_dir);
}

KinematicsConfig KinematicsConfig::from_loader(const YamlLoader& loader,
                                               const std::string& base_dir) {
    KinematicsConfig config;

    std::filesystem::path urdf_path(loader.get_string(ROBOT, "urdf_path"));
    if (urdf_path.is_relative() && !base_dir.empty()) {
        urdf_path = std::filesystem::path(base_dir) / urdf_path;
    }
    config.urdf_path = urdf_path.string();

    if (loader.has(ROBOT, "base_link")) {
        config.base_link = loader.get_string(ROBOT, "base_link");
    }

    if (loader.has(ROBOT, "tip_link")) {
        config.tip_link = loader.get_string(ROBOT, "tip_link");
    } else if (loader.has(ROBOT, "limb")) {
        const std::string suffix =
            loader.has(ROBOT, "tip_suffix") ? loader.get_string(ROBOT, "tip_suffix") : "_gripper";
        config.tip_link = loader.get_string(ROBOT, "limb") + suffix;
    } else {
        throw std::runtime_error("Node 'robot' needs either 'tip_link' or 'limb'.");
    }

    read_optional(loader, "ik_max_iterations", config.solver.ik_max_iterations);
    read_optional(loader, "ik_epsilon", config.solver.ik_epsilon);
    read_optional(loader, "ik_vel_max_iterations", config.solver.ik_vel_max_iterations);
    read_optional(loader, "ik_vel_epsilon", config.solver.ik_vel_epsilon);
    read_optional(loader, "ik_lma_max_iterations", config.solver.ik_lma_max_iterations);
    read_optional(loader, "ik_residual_tolerance", config.solver.ik_residual_tolerance);
    read_optional(loader, "pinv_tolerance", config.solver.pinv_tolerance);
    read_optional(loader, "coriolis_step", config.solver.coriolis_step);

    if (loader.has(JOINT_STATE, "names")) {
        config.joint_names = loader.get_string_vector(JOINT_STATE, "names");
        const size_t n = config.joint_names.size();
        const auto positions = read_state_vector(loader, "positions", n);
        const auto velocities = read_state_vector(loader, "velocities", n);
        const auto efforts = read_state_vector(loader, "efforts", n);

        config.joint_states.resize(n);
        for (size_t i = 0; i < n; ++i) {
            config.joint_states[i] = {positions[i], velocities[i], efforts[i]};
        }
    }

    return config;
}

}  // namespace armkin
