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

namespace armkin {

/*
 * Moore-Penrose pseudo-inverse via SVD. Singular values below
 * tolerance * max(rows, cols) * sigma_max are treated as zero, so rank
 * deficient matrices still yield a finite result.
 */
Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& m, double tolerance = 1e-6);

// I - pinv(J) * J
Eigen::MatrixXd null_space(const Eigen::MatrixXd& jacobian, double tolerance = 1e-6);

// Throws SingularConfigurationError when the square matrix is not invertible
Eigen::MatrixXd checked_inverse(const Eigen::MatrixXd& m, const char* what);

}  // namespace armkin
