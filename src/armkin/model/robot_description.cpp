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

#include <armkin/kinematics/errors.hpp>
#include <armkin/model/robot_description.hpp>
#include <fstream>
#include <iostream>
#include <kdl_parser/kdl_parser.hpp>
#include <sstream>
#include <utility>

namespace armkin {

RobotDescription::RobotDescription(std::shared_ptr<const urdf::ModelInterface> model,
                                   KDL::Tree tree)
    : model_(std::move(model)), tree_(std::move(tree)) {
    name_ = model_->getName();
    root_link_ = model_->getRoot() ? model_->getRoot()->name : std::string();
}

RobotDescription RobotDescription::from_string(const std::string& urdf_xml) {
    urdf::ModelInterfaceSharedPtr model = urdf::parseURDF(urdf_xml);
    if (!model) {
        throw ConstructionError("failed to parse URDF");
    }

    KDL::Tree tree;
    if (!kdl_parser::treeFromUrdfModel(*model, tree)) {
        throw ConstructionError("failed to extract KDL tree from URDF model '" +
                                model->getName() + "'");
    }

    return RobotDescription(model, std::move(tree));
}

RobotDescription RobotDescription::from_file(const std::string& urdf_path) {
    std::ifstream file(urdf_path);
    if (!file.is_open()) {
        throw ConstructionError("failed to open URDF file: " + urdf_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return from_string(buffer.str());
}

KDL::Chain RobotDescription::get_chain(const std::string& base_link,
                                       const std::string& tip_link) const {
    KDL::Chain chain;
    if (!tree_.getChain(base_link, tip_link, chain)) {
        throw ConstructionError("no KDL chain from '" + base_link + "' to '" + tip_link + "'");
    }
    return chain;
}

RobotDescriptionSummary RobotDescription::summary() const {
    RobotDescriptionSummary summary;
    for (const auto& entry : model_->joints_) {
        if (entry.second->type != urdf::Joint::FIXED) {
            summary.urdf_non_fixed_joints++;
        }
    }
    summary.urdf_joints = model_->joints_.size();
    summary.urdf_links = model_->links_.size();
    summary.kdl_joints = tree_.getNrOfJoints();
    summary.kdl_segments = tree_.getNrOfSegments();
    return summary;
}

void RobotDescription::print(std::ostream& os) const {
    const RobotDescriptionSummary s = summary();
    os << "URDF non-fixed joints: " << s.urdf_non_fixed_joints << ";" << std::endl;
    os << "URDF total joints: " << s.urdf_joints << std::endl;
    os << "URDF links: " << s.urdf_links << std::endl;
    os << "KDL joints: " << s.kdl_joints << std::endl;
    os << "KDL segments: " << s.kdl_segments << std::endl;
}

std::vector<std::string> chain_joint_names(const KDL::Chain& chain) {
    std::vector<std::string> names;
    names.reserve(chain.getNrOfJoints());
    for (unsigned int i = 0; i < chain.getNrOfSegments(); ++i) {
        const KDL::Joint& joint = chain.getSegment(i).getJoint();
        if (joint.getType() != KDL::Joint::None) {
            names.push_back(joint.getName());
        }
    }
    return names;
}

std::vector<std::string> chain_segment_names(const KDL::Chain& chain) {
    std::vector<std::string> names;
    names.reserve(chain.getNrOfSegments());
    for (unsigned int i = 0; i < chain.getNrOfSegments(); ++i) {
        names.push_back(chain.getSegment(i).getName());
    }
    return names;
}

}  // namespace armkin
