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

#include <map>
#include <string>
#include <vector>

namespace armkin {

// Represents the state of a single joint: position, velocity, and effort.
struct JointState {
    double position = 0.0;
    double velocity = 0.0;
    double effort = 0.0;
};

enum class JointQuantity { POSITION, VELOCITY, EFFORT };

inline double get_quantity(const JointState& state, JointQuantity kind) {
    switch (kind) {
        case JointQuantity::VELOCITY:
            return state.velocity;
        case JointQuantity::EFFORT:
            return state.effort;
        case JointQuantity::POSITION:
        default:
            return state.position;
    }
}

// Abstract source of the current joint state of one limb (driver, simulator, buffer).
class JointStateSource {
public:
    virtual ~JointStateSource() = default;

    // Fixed, ordered joint names of the limb
    virtual const std::vector<std::string>& joint_names() const = 0;

    // Snapshot of the current state keyed by joint name
    virtual std::map<std::string, JointState> get_joint_states() const = 0;
};

}  // namespace armkin
