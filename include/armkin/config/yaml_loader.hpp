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

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace armkin {

class YamlLoader {
public:
    explicit YamlLoader(const std::string& filepath) {
        try {
            root_ = YAML::LoadFile(filepath);
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to load YAML file: " + filepath +
                                     ", error: " + e.what());
        }
    }

    // Parse YAML text directly
    static YamlLoader from_string(const std::string& text) { return YamlLoader(YAML::Load(text)); }

    double get_double(const std::string& node_name, const std::string& key) const {
        return as<double>(node_name, key);
    }

    int get_int(const std::string& node_name, const std::string& key) const {
        return as<int>(node_name, key);
    }

    std::string get_string(const std::string& node_name, const std::string& key) const {
        return as<std::string>(node_name, key);
    }

    std::vector<double> get_vector(const std::string& node_name, const std::string& key) const {
        return as<std::vector<double>>(node_name, key);
    }

    std::vector<std::string> get_string_vector(const std::string& node_name,
                                               const std::string& key) const {
        return as<std::vector<std::string>>(node_name, key);
    }

    // Check if key exists
    bool has(const std::string& node_name, const std::string& key) const {
        return root_[node_name] && root_[node_name][key];
    }

    bool has(const std::string& node_name) const { return static_cast<bool>(root_[node_name]); }

private:
    explicit YamlLoader(YAML::Node root) : root_(std::move(root)) {}

    template <typename T>
    T as(const std::string& node_name, const std::string& key) const {
        try {
            return get_node(node_name, key).as<T>();
        } catch (const YAML::BadConversion& e) {
            throw std::runtime_error("Key '" + key + "' under node '" + node_name +
                                     "' has the wrong type: " + e.what());
        }
    }

    YAML::Node get_node(const std::string& node_name, const std::string& key) const {
        if (!root_[node_name]) {
            throw std::runtime_error("Node '" + node_name + "' not found.");
        }
        if (!root_[node_name][key]) {
            throw std::runtime_error("Key '" + key + "' not found under node '" + node_name + "'.");
        }
        return root_[node_name][key];
    }

    YAML::Node root_;
};

}  // namespace armkin
