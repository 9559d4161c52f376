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

#include <armkin/kinematics/kinematics.hpp>
#include <armkin/kinematics/linalg.hpp>
#include <kdl/chaindynparam.hpp>
#include <kdl/jntspaceinertiamatrix.hpp>
#include <vector>

namespace armkin {

namespace {

Eigen::MatrixXd mass_matrix(KDL::ChainDynParam& solver, const KDL::JntArray& q) {
    KDL::JntSpaceInertiaMatrix inertia_matrix(q.rows());
    if (solver.JntToMass(q, inertia_matrix) < 0) {
        throw KinematicsError("joint space inertia computation failed");
    }
    return inertia_matrix.data;
}

}  // namespace

Eigen::MatrixXd Kinematics::inertia_at(const KDL::JntArray& q) const {
    KDL::ChainDynParam solver(chain_, KDL::Vector::Zero());
    return mass_matrix(solver, q);
}

Eigen::MatrixXd Kinematics::inertia(const JointInput& joint_values) const {
    return inertia_at(joints_to_kdl(JointQuantity::POSITION, joint_values));
}

Eigen::MatrixXd Kinematics::cart_inertia(const JointInput& joint_values) const {
    const KDL::JntArray q = joints_to_kdl(JointQuantity::POSITION, joint_values);

    const Eigen::MatrixXd js_inertia = inertia_at(q);
    const Eigen::MatrixXd jac = jacobian_at(q);

    const Eigen::MatrixXd js_inertia_inv = checked_inverse(js_inertia, "joint space inertia");
    return checked_inverse(jac * js_inertia_inv * jac.transpose(), "J * M^-1 * J^T");
}

/*
 * Christoffel symbols of the first kind contracted with the joint velocity:
 *
 *   C(i, j) = sum_k 0.5 * (dM(i, j)/dq_k + dM(i, k)/dq_j - dM(j, k)/dq_i) * dq_k
 *
 * The partial derivatives of M(q) are central differences of JntToMass.
 */
Eigen::MatrixXd Kinematics::coriolis_matrix(const JointInput& joint_values,
                                            const JointInput& joint_velocities) const {
    const KDL::JntArray q = joints_to_kdl(JointQuantity::POSITION, joint_values);
    const Eigen::VectorXd q_dot = joints_to_state(JointQuantity::VELOCITY, joint_velocities);

    const unsigned int n = num_joints_;
    const double h = params_.coriolis_step;

    KDL::ChainDynParam solver(chain_, KDL::Vector::Zero());

    // dM[k] = dM/dq_k
    std::vector<Eigen::MatrixXd> dM(n);
    for (unsigned int k = 0; k < n; ++k) {
        KDL::JntArray q_plus = q;
        KDL::JntArray q_minus = q;
        q_plus(k) += h;
        q_minus(k) -= h;
        dM[k] = (mass_matrix(solver, q_plus) - mass_matrix(solver, q_minus)) / (2.0 * h);
    }

    Eigen::MatrixXd coriolis = Eigen::MatrixXd::Zero(n, n);
    for (unsigned int i = 0; i < n; ++i) {
        for (unsigned int j = 0; j < n; ++j) {
            double c_ij = 0.0;
            for (unsigned int k = 0; k < n; ++k) {
                const double christoffel = 0.5 * (dM[k](i, j) + dM[j](i, k) - dM[i](j, k));
                c_ij += christoffel * q_dot(k);
            }
            coriolis(i, j) = c_ij;
        }
    }
    return coriolis;
}

Eigen::VectorXd Kinematics::coriolis_forces(const JointInput& joint_values,
                                            const JointInput& joint_velocities) const {
    const KDL::JntArray q = joints_to_kdl(JointQuantity::POSITION, joint_values);
    const KDL::JntArray q_dot = joints_to_kdl(JointQuantity::VELOCITY, joint_velocities);

    KDL::ChainDynParam solver(chain_, KDL::Vector::Zero());
    KDL::JntArray coriolis(num_joints_);
    if (solver.JntToCoriolis(q, q_dot, coriolis) < 0) {
        throw KinematicsError("Coriolis computation failed");
    }
    return coriolis.data;
}

}  // namespace armkin
