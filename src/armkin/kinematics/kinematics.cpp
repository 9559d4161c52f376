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

#include <algorithm>
#include <armkin/kinematics/kinematics.hpp>
#include <armkin/kinematics/linalg.hpp>
#include <iostream>
#include <kdl/chainfksolverpos_recursive.hpp>
#include <kdl/chainfksolvervel_recursive.hpp>
#include <kdl/chainiksolverpos_lma.hpp>
#include <kdl/chainiksolverpos_nr.hpp>
#include <kdl/chainiksolvervel_pinv.hpp>
#include <kdl/chainjnttojacsolver.hpp>
#include <kdl/frames.hpp>
#include <kdl/framevel.hpp>
#include <kdl/jacobian.hpp>
#include <utility>

namespace armkin {

namespace {

Pose to_pose(const KDL::Frame& frame) {
    double x, y, z, w;
    frame.M.GetQuaternion(x, y, z, w);

    Pose pose;
    pose.position = Eigen::Vector3d(frame.p.x(), frame.p.y(), frame.p.z());
    pose.orientation = Eigen::Quaterniond(w, x, y, z);
    return pose;
}

KDL::JntArray to_kdl(const Eigen::VectorXd& values) {
    KDL::JntArray array(values.size());
    array.data = values;
    return array;
}

}  // namespace

Kinematics::Kinematics(const RobotDescription& description, const std::string& base_link,
                       const std::string& tip_link, std::shared_ptr<const JointStateSource> source,
                       const SolverParams& params)
    : chain_(description.get_chain(base_link, tip_link)),
      base_link_(base_link),
      tip_link_(tip_link),
      num_joints_(chain_.getNrOfJoints()),
      joint_names_(chain_joint_names(chain_)),
      source_(std::move(source)),
      params_(params) {
    if (!source_) {
        throw ConstructionError("joint state source is null");
    }

    const auto& reported = source_->joint_names();
    for (const auto& name : joint_names_) {
        if (std::find(reported.begin(), reported.end(), name) == reported.end()) {
            std::cerr << "[WARN] joint '" << name
                      << "' is not reported by the joint state source" << std::endl;
        }
    }

    std::cout << "[Kinematics] chain " << base_link_ << " -> " << tip_link_
              << ", joints = " << num_joints_ << ", segments = " << chain_.getNrOfSegments()
              << std::endl;
}

std::vector<std::string> Kinematics::chain_segment_names() const {
    return armkin::chain_segment_names(chain_);
}

void Kinematics::print_chain(std::ostream& os) const {
    for (const auto& name : chain_segment_names()) {
        os << "* " << name << std::endl;
    }
}

Eigen::VectorXd Kinematics::resolve(JointQuantity kind, const JointInput& values,
                                    const char* what) const {
    if (values.is_vector()) {
        const Eigen::VectorXd& v = values.vector();
        if (static_cast<size_t>(v.size()) != num_joints_) {
            throw DimensionError(what, num_joints_, static_cast<size_t>(v.size()));
        }
        return v;
    }

    Eigen::VectorXd result(num_joints_);
    if (values.is_named()) {
        const auto& named = values.named();
        for (size_t i = 0; i < joint_names_.size(); ++i) {
            auto it = named.find(joint_names_[i]);
            if (it == named.end()) {
                throw MissingJointError(joint_names_[i]);
            }
            result(i) = it->second;
        }
        return result;
    }

    // One snapshot of the source per resolved quantity
    const std::map<std::string, JointState> current = source_->get_joint_states();
    for (size_t i = 0; i < joint_names_.size(); ++i) {
        auto it = current.find(joint_names_[i]);
        if (it == current.end()) {
            throw MissingJointError(joint_names_[i]);
        }
        result(i) = get_quantity(it->second, kind);
    }
    return result;
}

Eigen::VectorXd Kinematics::joints_to_state(JointQuantity kind, const JointInput& values) const {
    return resolve(kind, values, "Joint values");
}

KDL::JntArray Kinematics::joints_to_kdl(JointQuantity kind, const JointInput& values) const {
    return to_kdl(joints_to_state(kind, values));
}

KDL::JntArrayVel Kinematics::joints_to_kdl_vel(const JointInput& positions,
                                               const JointInput& velocities) const {
    return KDL::JntArrayVel(joints_to_kdl(JointQuantity::POSITION, positions),
                            joints_to_kdl(JointQuantity::VELOCITY, velocities));
}

Pose Kinematics::forward_position(const JointInput& joint_values) const {
    const KDL::JntArray q = joints_to_kdl(JointQuantity::POSITION, joint_values);

    KDL::ChainFkSolverPos_recursive fk_solver(chain_);
    KDL::Frame end_frame;
    if (fk_solver.JntToCart(q, end_frame) < 0) {
        throw KinematicsError("forward position kinematics failed");
    }
    return to_pose(end_frame);
}

Vector6d Kinematics::forward_velocity(const JointInput& joint_values,
                                      const JointInput& joint_velocities) const {
    const KDL::JntArrayVel q = joints_to_kdl_vel(joint_values, joint_velocities);

    KDL::ChainFkSolverVel_recursive fk_solver(chain_);
    KDL::FrameVel end_frame;
    if (fk_solver.JntToCart(q, end_frame) < 0) {
        throw KinematicsError("forward velocity kinematics failed");
    }

    const KDL::Twist twist = end_frame.GetTwist();
    Vector6d result;
    result << twist.vel.x(), twist.vel.y(), twist.vel.z(), twist.rot.x(), twist.rot.y(),
        twist.rot.z();
    return result;
}

std::optional<Eigen::VectorXd> Kinematics::inverse_kinematics(
    const Eigen::Vector3d& position, const std::optional<Eigen::Quaterniond>& orientation,
    const std::optional<Eigen::VectorXd>& seed) const {
    KDL::JntArray seed_array;
    if (seed) {
        if (static_cast<size_t>(seed->size()) != num_joints_) {
            throw InvalidSeedError(num_joints_, static_cast<size_t>(seed->size()));
        }
        seed_array = to_kdl(*seed);
    } else {
        seed_array = joints_to_kdl(JointQuantity::POSITION);
    }

    KDL::Frame goal_pose(KDL::Vector(position.x(), position.y(), position.z()));
    if (orientation) {
        const Eigen::Quaterniond rot = orientation->normalized();
        goal_pose.M = KDL::Rotation::Quaternion(rot.x(), rot.y(), rot.z(), rot.w());
    }

    KDL::JntArray result_angles(num_joints_);
    int status;
    if (orientation) {
        KDL::ChainFkSolverPos_recursive fk_solver(chain_);
        KDL::ChainIkSolverVel_pinv ik_vel_solver(chain_, params_.ik_vel_epsilon,
                                                 params_.ik_vel_max_iterations);
        KDL::ChainIkSolverPos_NR ik_solver(chain_, fk_solver, ik_vel_solver,
                                           params_.ik_max_iterations, params_.ik_epsilon);
        status = ik_solver.CartToJnt(seed_array, goal_pose, result_angles);
    } else {
        // Position-only goal: rotational error weights are zero
        Vector6d weights;
        weights << 1.0, 1.0, 1.0, 0.0, 0.0, 0.0;
        KDL::ChainIkSolverPos_LMA ik_solver(chain_, weights, params_.ik_epsilon,
                                            params_.ik_lma_max_iterations);
        status = ik_solver.CartToJnt(seed_array, goal_pose, result_angles);
    }

    if (status < 0) {
        std::cerr << "[WARN] IK did not converge (status " << status << ")" << std::endl;
        return std::nullopt;
    }

    // Reject solutions that stalled short of the target
    KDL::ChainFkSolverPos_recursive fk_solver(chain_);
    KDL::Frame reached;
    if (fk_solver.JntToCart(result_angles, reached) < 0) {
        return std::nullopt;
    }
    const KDL::Twist error = KDL::diff(reached, goal_pose);
    double residual = error.vel.Norm();
    if (orientation) {
        residual = std::max(residual, error.rot.Norm());
    }
    if (residual > params_.ik_residual_tolerance) {
        std::cerr << "[WARN] IK residual " << residual << " exceeds tolerance "
                  << params_.ik_residual_tolerance << std::endl;
        return std::nullopt;
    }

    return Eigen::VectorXd(result_angles.data);
}

Eigen::MatrixXd Kinematics::jacobian_at(const KDL::JntArray& q) const {
    KDL::ChainJntToJacSolver jac_solver(chain_);
    KDL::Jacobian kdl_jac(num_joints_);
    if (jac_solver.JntToJac(q, kdl_jac) < 0) {
        throw KinematicsError("Jacobian computation failed");
    }
    return kdl_jac.data;
}

Eigen::MatrixXd Kinematics::jacobian(const JointInput& joint_values) const {
    return jacobian_at(joints_to_kdl(JointQuantity::POSITION, joint_values));
}

Eigen::MatrixXd Kinematics::jacobian_transpose(const JointInput& joint_values) const {
    return jacobian(joint_values).transpose();
}

Eigen::MatrixXd Kinematics::jacobian_pseudo_inverse(const JointInput& joint_values) const {
    return pseudo_inverse(jacobian(joint_values), params_.pinv_tolerance);
}

Eigen::MatrixXd Kinematics::null_space_projector(const JointInput& joint_values) const {
    return null_space(jacobian(joint_values), params_.pinv_tolerance);
}

}  // namespace armkin
