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
#include <armkin/model/robot_description.hpp>
#include <sstream>
#include <test_models.hpp>

namespace armkin {

namespace {

const char* const kMinimalUrdf = R"(<?xml version="1.0"?>
<robot name="slider">
  <link name="rail"/>
  <link name="carriage">
    <inertial>
      <origin xyz="0 0 0"/>
      <mass value="2.0"/>
      <inertia ixx="0.1" ixy="0" ixz="0" iyy="0.1" iyz="0" izz="0.1"/>
    </inertial>
  </link>
  <joint name="slide" type="prismatic">
    <parent link="rail"/>
    <child link="carriage"/>
    <axis xyz="1 0 0"/>
    <limit lower="-0.5" upper="0.5" effort="10" velocity="1"/>
  </joint>
</robot>
)";

}  // namespace

TEST(RobotDescriptionTest, LoadsSixJointArm) {
    const RobotDescription description =
        RobotDescription::from_file(test::model_path("six_joint.urdf"));
    EXPECT_EQ(description.root_link(), "base");

    const RobotDescriptionSummary s = description.summary();
    EXPECT_EQ(s.urdf_non_fixed_joints, 6u);
    EXPECT_EQ(s.urdf_joints, 8u);
    EXPECT_EQ(s.urdf_links, 9u);
    EXPECT_EQ(s.kdl_joints, 6u);
    EXPECT_EQ(s.kdl_segments, 8u);
}

TEST(RobotDescriptionTest, PrintsSummary) {
    const RobotDescription description =
        RobotDescription::from_file(test::model_path("two_link.urdf"));

    std::ostringstream os;
    description.print(os);
    EXPECT_EQ(os.str(),
              "URDF non-fixed joints: 2;\n"
              "URDF total joints: 3\n"
              "URDF links: 4\n"
              "KDL joints: 2\n"
              "KDL segments: 3\n");
}

TEST(RobotDescriptionTest, ParsesInlineUrdf) {
    const RobotDescription description = RobotDescription::from_string(kMinimalUrdf);
    EXPECT_EQ(description.name(), "slider");
    EXPECT_EQ(description.root_link(), "rail");

    const KDL::Chain chain = description.get_chain("rail", "carriage");
    EXPECT_EQ(chain.getNrOfJoints(), 1u);
    EXPECT_EQ(chain_joint_names(chain), std::vector<std::string>{"slide"});
}

TEST(RobotDescriptionTest, ChainSkipsFixedJoints) {
    const RobotDescription description =
        RobotDescription::from_file(test::model_path("six_joint.urdf"));
    const KDL::Chain chain = description.get_chain("base", "right_gripper");

    EXPECT_EQ(chain_joint_names(chain),
              (std::vector<std::string>{"right_s0", "right_s1", "right_e0", "right_w0",
                                        "right_w1", "right_w2"}));
    EXPECT_EQ(chain.getNrOfSegments(), 7u);
    EXPECT_EQ(chain_segment_names(chain).back(), "right_gripper");
}

TEST(RobotDescriptionTest, RejectsInvalidInput) {
    EXPECT_THROW(RobotDescription::from_string("<robot"), ConstructionError);
    EXPECT_THROW(RobotDescription::from_string("<notarobot/>"), ConstructionError);
    EXPECT_THROW(RobotDescription::from_file(test::model_path("missing.urdf")),
                 ConstructionError);
}

TEST(RobotDescriptionTest, UnconnectedLinksHaveNoChain) {
    const RobotDescription description =
        RobotDescription::from_file(test::model_path("six_joint.urdf"));
    EXPECT_THROW(description.get_chain("base", "left_gripper"), ConstructionError);

    try {
        description.get_chain("right_gripper", "unknown");
        FAIL() << "expected ConstructionError";
    } catch (const ConstructionError& e) {
        EXPECT_NE(std::string(e.what()).find("no KDL chain"), std::string::npos);
    }
}

}  // namespace armkin
