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

#include <Eigen/Core>
#include <map>
#include <string>
#include <utility>
#include <variant>

namespace armkin {

/*
 * Joint values handed to a kinematics query: either the current state of the
 * joint state source, an explicit vector in chain order, or values by joint name.
 */
class JointInput {
public:
    struct UseCurrent {};
    using Named = std::map<std::string, double>;

    JointInput() : value_(UseCurrent{}) {}

    // Implicit so that callers can pass an Eigen vector or a name map directly
    JointInput(Eigen::VectorXd values) : value_(std::move(values)) {}
    JointInput(Named values) : value_(std::move(values)) {}

    static JointInput current() { return JointInput(); }

    bool is_current() const { return std::holds_alternative<UseCurrent>(value_); }
    bool is_vector() const { return std::holds_alternative<Eigen::VectorXd>(value_); }
    bool is_named() const { return std::holds_alternative<Named>(value_); }

    const Eigen::VectorXd& vector() const { return std::get<Eigen::VectorXd>(value_); }
    const Named& named() const { return std::get<Named>(value_); }

private:
    std::variant<UseCurrent, Eigen::VectorXd, Named> value_;
};

}  // namespace armkin
