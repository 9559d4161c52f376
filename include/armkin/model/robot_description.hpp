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

#include <urdf_parser/urdf_parser.h>

#include <iosfwd>
#include <kdl/chain.hpp>
#include <kdl/tree.hpp>
#include <memory>
#include <string>
#include <vector>

namespace armkin {

struct RobotDescriptionSummary {
    size_t urdf_non_fixed_joints = 0;
    size_t urdf_joints = 0;
    size_t urdf_links = 0;
    size_t kdl_joints = 0;
    size_t kdl_segments = 0;
};

/*
 * Parsed URDF robot model and the KDL tree built from it.
 * Chains between any two connected links are extracted on demand.
 */
class RobotDescription {
public:
    // Throws ConstructionError when the text is not a valid URDF robot
    static RobotDescription from_string(const std::string& urdf_xml);
    static RobotDescription from_file(const std::string& urdf_path);

    const std::string& name() const { return name_; }
    const std::string& root_link() const { return root_link_; }
    const KDL::Tree& tree() const { return tree_; }

    // Throws ConstructionError when base_link and tip_link are not connected
    KDL::Chain get_chain(const std::string& base_link, const std::string& tip_link) const;

    RobotDescriptionSummary summary() const;
    void print(std::ostream& os) const;

private:
    RobotDescription(std::shared_ptr<const urdf::ModelInterface> model, KDL::Tree tree);

    std::shared_ptr<const urdf::ModelInterface> model_;
    KDL::Tree tree_;
    std::string name_;
    std::string root_link_;
};

// Names of the non-fixed joints of a chain, in chain order
std::vector<std::string> chain_joint_names(const KDL::Chain& chain);

// Names of every segment of a chain, in chain order
std::vector<std::string> chain_segment_names(const KDL::Chain& chain);

}  // namespace armkin
