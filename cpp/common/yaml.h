// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Extensions of yaml-cpp for reading and printing the Setting types
// of this project.

#pragma once

#include "setting.h"

#include <yaml-cpp/yaml.h>

namespace YAML {

// A null value leaves an optional parameter unset
template <typename T>
struct convert<std::optional<T>>
{
    static auto decode(const Node& node, std::optional<T>& rhs) -> bool
    {
        if (!node.IsNull()) {
            rhs.emplace(node.as<T>());
        }
        return true;
    }
};

} // namespace YAML

namespace lstmatch {

template <typename T>
auto operator<<(YAML::Emitter& out,
                const std::optional<T> value) -> YAML::Emitter&
{
    if (value) {
        out << value.value();
    } else {
        out << YAML::Null;
    }
    return out;
}

// Emitter with a switch for printing the type and description of each
// parameter in addition to its value
class Emitter : public YAML::Emitter
{
public:
    bool verbose {};
};

template <typename T>
static auto operator<<(Emitter& out, const Setting<T>& setting) -> Emitter&
{
    out << YAML::Key << setting.yaml_keys.back();
    if (out.verbose) {
        out << YAML::Value;
        out << YAML::BeginMap;
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Key << "default" << YAML::Value << static_cast<T>(setting);
        out << YAML::Key << "type" << YAML::Value << setting.type;
        out << YAML::Key << "info" << YAML::Value << YAML::Literal
            << setting.info;
        out << YAML::EndMap;
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Value << static_cast<T>(setting);
    }
    return out;
}

} // namespace lstmatch
