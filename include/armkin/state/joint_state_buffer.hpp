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

#include <armkin/state/joint_state.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace armkin {

// Thread-safe in-memory joint state of one limb. Joints not yet written read as zero.
class JointStateBuffer : public JointStateSource {
public:
    explicit JointStateBuffer(std::vector<std::string> joint_names);

    const std::vector<std::string>& joint_names() const override { return joint_names_; }

    std::map<std::string, JointState> get_joint_states() const override;

    // Unknown names are rejected with std::invalid_argument
    void set_joint_state(const std::string& name, const JointState& state);

    // States in joint_names() order; the size must match
    void set_all_joint_states(const std::vector<JointState>& states);

    JointState get_joint_state(const std::string& name) const;

    size_t get_size() const { return joint_names_.size(); }

private:
    const std::vector<std::string> joint_names_;

    mutable std::mutex mutex_;
    std::map<std::string, JointState> states_;
};

}  // namespace armkin
