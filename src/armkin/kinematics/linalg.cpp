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
#include <armkin/kinematics/errors.hpp>
#include <armkin/kinematics/linalg.hpp>
#include <string>

namespace armkin {

Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& m, double tolerance) {
    if (m.size() == 0) {
        return Eigen::MatrixXd::Zero(m.cols(), m.rows());
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(m, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const double sigma_max = svd.singularValues().array().abs().maxCoeff();
    const double tol = tolerance * std::max(m.cols(), m.rows()) * sigma_max;

    Eigen::VectorXd singular_values_inv = svd.singularValues();
    for (int i = 0; i < singular_values_inv.size(); ++i) {
        singular_values_inv(i) =
            (singular_values_inv(i) > tol) ? 1.0 / singular_values_inv(i) : 0.0;
    }
    return svd.matrixV() * singular_values_inv.asDiagonal() * svd.matrixU().transpose();
}

Eigen::MatrixXd null_space(const Eigen::MatrixXd& jacobian, double tolerance) {
    const Eigen::MatrixXd j_pinv = pseudo_inverse(jacobian, tolerance);
    Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(jacobian.cols(), jacobian.cols());
    return identity - j_pinv * jacobian;
}

Eigen::MatrixXd checked_inverse(const Eigen::MatrixXd& m, const char* what) {
    Eigen::FullPivLU<Eigen::MatrixXd> lu(m);
    if (m.rows() != m.cols() || !lu.isInvertible()) {
        throw SingularConfigurationError(std::string(what) + " is not invertible (rank " +
                                         std::to_string(lu.rank()) + " of " +
                                         std::to_string(m.rows()) + ")");
    }
    return lu.inverse();
}

}  // namespace armkin
