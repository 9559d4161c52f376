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

#include <gtest/gtest.h>

#include <armkin/kinematics/errors.hpp>
#include <armkin/kinematics/linalg.hpp>

namespace armkin {

TEST(PseudoInverseTest, InvertibleMatrix) {
    Eigen::MatrixXd m(2, 2);
    m << 4.0, 1.0, 2.0, 3.0;
    EXPECT_TRUE(pseudo_inverse(m).isApprox(m.inverse(), 1e-12));
}

TEST(PseudoInverseTest, WideMatrixIsRightInverse) {
    Eigen::MatrixXd m(2, 3);
    m << 1.0, 0.0, 2.0, 0.0, 1.0, -1.0;
    const Eigen::MatrixXd pinv = pseudo_inverse(m);
    ASSERT_EQ(pinv.rows(), 3);
    ASSERT_EQ(pinv.cols(), 2);
    EXPECT_TRUE((m * pinv - Eigen::MatrixXd::Identity(2, 2)).norm() < 1e-12);
}

TEST(PseudoInverseTest, RankDeficientMatrixSatisfiesPenroseConditions) {
    Eigen::MatrixXd m(3, 3);
    m << 1.0, 2.0, 3.0, 2.0, 4.0, 6.0, 0.0, 1.0, 1.0;
    const Eigen::MatrixXd pinv = pseudo_inverse(m);

    EXPECT_TRUE(pinv.allFinite());
    EXPECT_TRUE((m * pinv * m - m).norm() < 1e-10);
    EXPECT_TRUE((pinv * m * pinv - pinv).norm() < 1e-10);
    EXPECT_TRUE(((m * pinv).transpose() - m * pinv).norm() < 1e-10);
    EXPECT_TRUE(((pinv * m).transpose() - pinv * m).norm() < 1e-10);
}

TEST(PseudoInverseTest, ZeroMatrix) {
    const Eigen::MatrixXd m = Eigen::MatrixXd::Zero(3, 2);
    const Eigen::MatrixXd pinv = pseudo_inverse(m);
    ASSERT_EQ(pinv.rows(), 2);
    ASSERT_EQ(pinv.cols(), 3);
    EXPECT_TRUE(pinv.isZero(0.0));
}

TEST(NullSpaceTest, ProjectsOntoKernel) {
    Eigen::MatrixXd jac(2, 3);
    jac << 1.0, 0.0, 0.0, 0.0, 1.0, 0.0;
    const Eigen::MatrixXd projector = null_space(jac);

    Eigen::MatrixXd expected = Eigen::MatrixXd::Zero(3, 3);
    expected(2, 2) = 1.0;
    EXPECT_TRUE((projector - expected).norm() < 1e-12);
    EXPECT_TRUE((jac * projector).norm() < 1e-12);
    EXPECT_TRUE((projector * projector - projector).norm() < 1e-12);
}

TEST(CheckedInverseTest, InvertsRegularMatrix) {
    Eigen::MatrixXd m(2, 2);
    m << 2.0, 0.0, 1.0, 1.0;
    EXPECT_TRUE((checked_inverse(m, "m") * m - Eigen::MatrixXd::Identity(2, 2)).norm() < 1e-12);
}

TEST(CheckedInverseTest, SingularMatrixThrows) {
    Eigen::MatrixXd m(2, 2);
    m << 1.0, 2.0, 2.0, 4.0;
    try {
        checked_inverse(m, "Operational space inertia");
        FAIL() << "expected SingularConfigurationError";
    } catch (const SingularConfigurationError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("Operational space inertia"), std::string::npos);
        EXPECT_NE(message.find("rank 1 of 2"), std::string::npos);
    }
}

TEST(CheckedInverseTest, NonSquareMatrixThrows) {
    const Eigen::MatrixXd m = Eigen::MatrixXd::Identity(2, 3);
    EXPECT_THROW(checked_inverse(m, "m"), SingularConfigurationError);
}

}  // namespace armkin
