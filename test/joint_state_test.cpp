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

#include <armkin/state/joint_state_buffer.hpp>
#include <stdexcept>
#include <thread>

namespace armkin {

TEST(JointStateTest, QuantitySelection) {
    const JointState state{1.0, 2.0, 3.0};
    EXPECT_DOUBLE_EQ(get_quantity(state, JointQuantity::POSITION), 1.0);
    EXPECT_DOUBLE_EQ(get_quantity(state, JointQuantity::VELOCITY), 2.0);
    EXPECT_DOUBLE_EQ(get_quantity(state, JointQuantity::EFFORT), 3.0);
}

TEST(JointStateBufferTest, StartsAtRest) {
    JointStateBuffer buffer({"a", "b"});
    EXPECT_EQ(buffer.get_size(), 2u);
    EXPECT_EQ(buffer.joint_names(), (std::vector<std::string>{"a", "b"}));

    const auto states = buffer.get_joint_states();
    ASSERT_EQ(states.size(), 2u);
    for (const auto& [name, state] : states) {
        EXPECT_DOUBLE_EQ(state.position, 0.0) << name;
        EXPECT_DOUBLE_EQ(state.velocity, 0.0) << name;
        EXPECT_DOUBLE_EQ(state.effort, 0.0) << name;
    }
}

TEST(JointStateBufferTest, SetSingleJoint) {
    JointStateBuffer buffer({"a", "b"});
    buffer.set_joint_state("b", {0.5, -1.0, 2.0});

    const JointState b = buffer.get_joint_state("b");
    EXPECT_DOUBLE_EQ(b.position, 0.5);
    EXPECT_DOUBLE_EQ(b.velocity, -1.0);
    EXPECT_DOUBLE_EQ(b.effort, 2.0);
    EXPECT_DOUBLE_EQ(buffer.get_joint_state("a").position, 0.0);
}

TEST(JointStateBufferTest, SetAllFollowsNameOrder) {
    JointStateBuffer buffer({"z", "a"});
    buffer.set_all_joint_states({{1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}});

    const auto states = buffer.get_joint_states();
    EXPECT_DOUBLE_EQ(states.at("z").position, 1.0);
    EXPECT_DOUBLE_EQ(states.at("a").position, 2.0);
}

TEST(JointStateBufferTest, RejectsBadInput) {
    EXPECT_THROW(JointStateBuffer({"a", "a"}), std::invalid_argument);

    JointStateBuffer buffer({"a", "b"});
    EXPECT_THROW(buffer.set_joint_state("c", JointState{}), std::invalid_argument);
    EXPECT_THROW(buffer.set_all_joint_states({JointState{}}), std::invalid_argument);
}

TEST(JointStateBufferTest, ConcurrentWritersAndReaders) {
    JointStateBuffer buffer({"a", "b"});

    std::thread writer([&buffer]() {
        for (int i = 1; i <= 1000; ++i) {
            const double v = static_cast<double>(i);
            buffer.set_all_joint_states({{v, v, v}, {v, v, v}});
        }
    });

    // Both joints are always written together, so a snapshot never mixes updates
    for (int i = 0; i < 1000; ++i) {
        const auto states = buffer.get_joint_states();
        EXPECT_DOUBLE_EQ(states.at("a").position, states.at("b").position);
    }
    writer.join();

    EXPECT_DOUBLE_EQ(buffer.get_joint_state("a").position, 1000.0);
}

}  // namespace armkin
