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

#include <Eigen/Dense>
#include <armkin/kinematics/errors.hpp>
#include <armkin/kinematics/joint_input.hpp>
#include <armkin/model/robot_description.hpp>
#include <armkin/state/joint_state.hpp>
#include <iosfwd>
#include <kdl/chain.hpp>
#include <kdl/jntarray.hpp>
#include <kdl/jntarrayvel.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace armkin {

using Vector6d = Eigen::Matrix<double, 6, 1>;

struct Pose {
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    Eigen::Quaterniond orientation = Eigen::Quaterniond::Identity();
};

// Tolerances handed to the KDL solvers and the numerical routines
struct SolverParams {
    // Newton-Raphson position IK (full pose goals)
    int ik_max_iterations = 100;
    double ik_epsilon = 1e-6;
    // Pseudo-inverse velocity IK used inside Newton-Raphson
    int ik_vel_max_iterations = 150;
    double ik_vel_epsilon = 1e-5;
    // Levenberg-Marquardt IK (position-only goals)
    int ik_lma_max_iterations = 500;
    // Maximum pose error accepted from a solver that reported success
    double ik_residual_tolerance = 1e-4;

    // Relative singular value cut-off of jacobian_pseudo_inverse()
    double pinv_tolerance = 1e-6;
    // Central difference step of the inertia derivative in coriolis_matrix()
    double coriolis_step = 1e-6;
};

/*
 * Kinematics and dynamics of one serial chain using Orocos
 * Kinematics and Dynamics Library (KDL).
 *
 * Joint arguments default to the current state reported by the joint state
 * source. All queries are const: solvers are built per call over the
 * immutable chain, so one instance can be queried from several threads.
 */
class Kinematics {
public:
    Kinematics(const RobotDescription& description, const std::string& base_link,
               const std::string& tip_link, std::shared_ptr<const JointStateSource> source,
               const SolverParams& params = SolverParams());

    unsigned int num_joints() const { return num_joints_; }
    const std::string& base_link() const { return base_link_; }
    const std::string& tip_link() const { return tip_link_; }
    const std::vector<std::string>& joint_names() const { return joint_names_; }
    const KDL::Chain& chain() const { return chain_; }
    const SolverParams& params() const { return params_; }

    std::vector<std::string> chain_segment_names() const;
    void print_chain(std::ostream& os) const;

    // N-vector of one joint quantity in chain order
    Eigen::VectorXd joints_to_state(JointQuantity kind, const JointInput& values = {}) const;
    KDL::JntArray joints_to_kdl(JointQuantity kind, const JointInput& values = {}) const;
    KDL::JntArrayVel joints_to_kdl_vel(const JointInput& positions = {},
                                       const JointInput& velocities = {}) const;

    Pose forward_position(const JointInput& joint_values = {}) const;

    // Tip twist in the base frame: linear velocity then angular velocity
    Vector6d forward_velocity(const JointInput& joint_values = {},
                              const JointInput& joint_velocities = {}) const;

    /*
     * Joint positions reaching the target, or std::nullopt when the solver does
     * not converge. Without an orientation only the position is constrained.
     * An explicit seed must have num_joints() entries (InvalidSeedError).
     */
    std::optional<Eigen::VectorXd> inverse_kinematics(
        const Eigen::Vector3d& position,
        const std::optional<Eigen::Quaterniond>& orientation = std::nullopt,
        const std::optional<Eigen::VectorXd>& seed = std::nullopt) const;

    Eigen::MatrixXd jacobian(const JointInput& joint_values = {}) const;
    Eigen::MatrixXd jacobian_transpose(const JointInput& joint_values = {}) const;
    Eigen::MatrixXd jacobian_pseudo_inverse(const JointInput& joint_values = {}) const;
    Eigen::MatrixXd null_space_projector(const JointInput& joint_values = {}) const;

    // Joint space inertia matrix, gravity fixed at zero
    Eigen::MatrixXd inertia(const JointInput& joint_values = {}) const;

    // (J * M^-1 * J^T)^-1, throws SingularConfigurationError when not invertible
    Eigen::MatrixXd cart_inertia(const JointInput& joint_values = {}) const;

    // C(q, dq) from the Christoffel symbols of M(q)
    Eigen::MatrixXd coriolis_matrix(const JointInput& joint_values = {},
                                    const JointInput& joint_velocities = {}) const;

    // C(q, dq) * dq as computed by KDL
    Eigen::VectorXd coriolis_forces(const JointInput& joint_values = {},
                                    const JointInput& joint_velocities = {}) const;

private:
    Eigen::VectorXd resolve(JointQuantity kind, const JointInput& values,
                            const char* what) const;
    Eigen::MatrixXd inertia_at(const KDL::JntArray& q) const;
    Eigen::MatrixXd jacobian_at(const KDL::JntArray& q) const;

    const KDL::Chain chain_;
    const std::string base_link_;
    const std::string tip_link_;
    const unsigned int num_joints_;
    const std::vector<std::string> joint_names_;
    const std::shared_ptr<const JointStateSource> source_;
    const SolverParams params_;
};

}  // namespace armkin
