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
#include <armkin/kinematics/kinematics.hpp>
#include <armkin/model/robot_description.hpp>
#include <armkin/state/joint_state_buffer.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            std::cerr << "Usage: " << argv[0] << " <config_yaml>" << std::endl;
            std::cerr << "Example: " << argv[0] << " config/two_link.yaml" << std::endl;
            return 1;
        }

        const std::string config_path = argv[1];
        if (!std::filesystem::exists(config_path)) {
            std::cerr << "[ERROR] Config file not found: " << config_path << std::endl;
            return 1;
        }

        const armkin::KinematicsConfig config = armkin::KinematicsConfig::load(config_path);
        const armkin::RobotDescription description =
            armkin::RobotDescription::from_file(config.urdf_path);

        const std::string base_link =
            config.base_link.empty() ? description.root_link() : config.base_link;

        std::cout << "=== armkin inspect ===" << std::endl;
        std::cout << "Robot          : " << description.name() << std::endl;
        std::cout << "URDF path      : " << config.urdf_path << std::endl;
        std::cout << "Base link      : " << base_link << std::endl;
        std::cout << "Tip link       : " << config.tip_link << std::endl;
        description.print(std::cout);

        // Without an explicit joint_state block the chain's joints start at zero
        std::vector<std::string> names = config.joint_names;
        if (names.empty()) {
            names = armkin::chain_joint_names(description.get_chain(base_link, config.tip_link));
        }
        auto state = std::make_shared<armkin::JointStateBuffer>(names);
        if (!config.joint_states.empty()) {
            state->set_all_joint_states(config.joint_states);
        }

        armkin::Kinematics kinematics(description, base_link, config.tip_link, state,
                                      config.solver);

        std::cout << "=== Chain ===" << std::endl;
        kinematics.print_chain(std::cout);

        const Eigen::IOFormat fmt(6, 0, ", ", "\n", "  [", "]");
        std::cout << std::fixed << std::setprecision(6);

        const armkin::Pose pose = kinematics.forward_position();
        std::cout << "=== Forward position ===" << std::endl;
        std::cout << "  position    : " << pose.position.transpose().format(fmt) << std::endl;
        std::cout << "  orientation : " << pose.orientation.coeffs().transpose().format(fmt)
                  << std::endl;

        std::cout << "=== Forward velocity ===" << std::endl;
        std::cout << kinematics.forward_velocity().transpose().format(fmt) << std::endl;

        std::cout << "=== Jacobian ===" << std::endl;
        std::cout << kinematics.jacobian().format(fmt) << std::endl;

        std::cout << "=== Jacobian pseudo-inverse ===" << std::endl;
        std::cout << kinematics.jacobian_pseudo_inverse().format(fmt) << std::endl;

        std::cout << "=== Inertia ===" << std::endl;
        std::cout << kinematics.inertia().format(fmt) << std::endl;

        std::cout << "=== Coriolis ===" << std::endl;
        std::cout << kinematics.coriolis_matrix().format(fmt) << std::endl;

        std::cout << "=== Cartesian inertia ===" << std::endl;
        try {
            std::cout << kinematics.cart_inertia().format(fmt) << std::endl;
        } catch (const armkin::SingularConfigurationError& e) {
            std::cout << "  unavailable: " << e.what() << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
