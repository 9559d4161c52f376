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

#include <cstddef>
#include <stdexcept>
#include <string>

namespace armkin {

// Base class of every error raised by the kinematics engine
class KinematicsError : public std::runtime_error {
public:
    explicit KinematicsError(const std::string& message) : std::runtime_error(message) {}
};

// Robot description cannot be parsed or base/tip do not form a chain
class ConstructionError : public KinematicsError {
public:
    explicit ConstructionError(const std::string& message)
        : KinematicsError("Construction error: " + message) {}
};

class MissingJointError : public KinematicsError {
public:
    explicit MissingJointError(const std::string& joint_name)
        : KinematicsError("Missing joint: '" + joint_name + "'"), joint_name_(joint_name) {}

    const std::string& joint_name() const { return joint_name_; }

private:
    std::string joint_name_;
};

// Explicit joint vector whose length differs from the chain's joint count
class DimensionError : public KinematicsError {
public:
    DimensionError(const std::string& what, size_t expected, size_t actual)
        : KinematicsError(what + ": expected " + std::to_string(expected) + " values, got " +
                          std::to_string(actual)),
          expected_(expected),
          actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class InvalidSeedError : public DimensionError {
public:
    InvalidSeedError(size_t expected, size_t actual)
        : DimensionError("Invalid IK seed", expected, actual) {}
};

// Raised by cart_inertia() when M or J * M^-1 * J^T cannot be inverted
class SingularConfigurationError : public KinematicsError {
public:
    explicit SingularConfigurationError(const std::string& message)
        : KinematicsError("Singular configuration: " + message) {}
};

}  // namespace armkin
