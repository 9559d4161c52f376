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

#include <armkin/state/joint_state_buffer.hpp>
#include <stdexcept>
#include <utility>

namespace armkin {

JointStateBuffer::JointStateBuffer(std::vector<std::string> joint_names)
    : joint_names_(std::move(joint_names)) {
    for (const auto& name : joint_names_) {
        if (!states_.emplace(name, JointState{}).second) {
            throw std::invalid_argument("JointStateBuffer: duplicate joint name '" + name + "'");
        }
    }
}

std::map<std::string, JointState> JointStateBuffer::get_joint_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
}

void JointStateBuffer::set_joint_state(const std::string& name, const JointState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(name);
    if (it == states_.end()) {
        throw std::invalid_argument("JointStateBuffer: unknown joint '" + name + "'");
    }
    it->second = state;
}

void JointStateBuffer::set_all_joint_states(const std::vector<JointState>& states) {
    if (states.size() != joint_names_.size()) {
        throw std::invalid_argument("set_all_joint_states: size mismatch.");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < joint_names_.size(); ++i) {
        states_[joint_names_[i]] = states[i];
    }
}

JointState JointStateBuffer::get_joint_state(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(name);
    return it != states_.end() ? it->second : JointState{};
}

}  // namespace armkin
