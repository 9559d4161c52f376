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

#pragma once

#include <armkin/config/yaml_loader.hpp>
#include <armkin/kinematics/kinematics.hpp>
#include <armkin/state/joint_state.hpp>
#include <string>
#include <vector>

namespace armkin {

/*
 * Contents of a kinematics YAML file:
 *
 *   robot:
 *     urdf_path: baxter.urdf      # relative to the YAML file
 *     base_link: base             # optional, URDF root by default
 *     limb: right                 # tip = limb + tip_suffix, unless tip_link is set
 *     tip_suffix: _gripper
 *   solver:                       # every key optional, see SolverParams
 *     ik_max_iterations: 100
 *   joint_state:                  # optional initial state
 *     names: [right_s0, ...]
 *     positions: [0.0, ...]
 */
struct KinematicsConfig {
    std::string urdf_path;
    std::string base_link;  // empty: URDF root link
    std::string tip_link;
    SolverParams solver;

    std::vector<std::string> joint_names;
    std::vector<JointState> joint_states;

    static KinematicsConfig load(const std::string& path);

    // Relative URDF paths are resolved against base_dir
    static KinematicsConfig from_loader(const YamlLoader& loader, const std::string& base_dir);
};

}  // namespace armkin
