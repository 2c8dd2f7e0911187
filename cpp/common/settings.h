// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Abstract class for storing all user defined configuration
// parameters of a processor. The parameters themselves are Setting
// members of a derived class, which lists them in scanKeys:
//
// class SettingsDerived : public Settings
// {
// public:
//     SettingsDerived(const std::string& yaml_file) : Settings { yaml_file } {}
//     struct
//     {
//         Setting<double> tolerance { { "window", "tolerance" }, 1.0, "" };
//     } window;
//     auto scanKeys() -> void override { scan(window.tolerance); }
//     auto checkParameters() -> void override {}
// };
//
// The same scanKeys is used for reading a configuration file and for
// printing the default or current configuration.

#pragma once

#include "yaml.h"

#include <algorithm>

namespace lstmatch {

class Settings
{
private:
    // Whether scan writes the setting to yaml_emitter instead of
    // reading it from config
    bool do_dump { false };
    // Warn about keys in the configuration file that no setting
    // refers to
    auto unrecognizedKeywordCheck() const -> void;
    // YAML keys of the map currently open in yaml_emitter
    std::vector<std::string> cur_map_loc {};
    Emitter yaml_emitter {};
    // Write one setting into the emitter, opening and closing maps
    // when the key path of the setting differs from the previous one.
    template <typename T>
    auto dump(Emitter& emitter, const Setting<T>& setting) -> void
    {
        const auto& keys { setting.yaml_keys };
        while (cur_map_loc.size() + 1 > keys.size()) {
            emitter << YAML::EndMap;
            cur_map_loc.pop_back();
        }
        for (int i { static_cast<int>(
               std::min(cur_map_loc.size(), keys.size() - 1) - 1) };
             i >= 0;
             --i) {
            if (cur_map_loc.at(i) != keys.at(i)) {
                emitter << YAML::EndMap;
                cur_map_loc.pop_back();
            }
        }
        for (int i { static_cast<int>(cur_map_loc.size()) };
             i < static_cast<int>(keys.size() - 1);
             ++i) {
            cur_map_loc.push_back(keys.at(i));
            emitter << YAML::Key << cur_map_loc.back() << YAML::Value
                    << YAML::BeginMap;
        }
        emitter << setting;
    }

protected:
    // Configuration as read from file
    YAML::Node config {};
    // Default configuration, used for filling in values the user did
    // not set when the configuration is stored in the output
    YAML::Node default_config {};
    // Every key path visited by scan
    std::vector<std::vector<std::string>> all_valid_keys {};
    // Validate parameter values and their consistency. Parameters may
    // be normalized here, hence not const.
    virtual auto checkParameters() -> void = 0;

public:
    Settings() = default;
    Settings(const std::string& yaml_file)
      : config { YAML::LoadFile(yaml_file) }
    {}
    Settings(const Settings& /* settings */) {};
    // Read all parameters from the configuration and check them
    auto init() -> void;
    virtual auto scanKeys() -> void = 0;
    // Either dump the setting into the emitter or set it from the
    // configuration. A setting missing from the configuration keeps
    // its default value.
    template <typename T>
    auto scan(Setting<T>& item)
    {
        if (do_dump) {
            dump(yaml_emitter, item);
            return;
        }
        if (item.yaml_keys.empty()) {
            return;
        }
        all_valid_keys.push_back(item.yaml_keys);
        YAML::Node node { YAML::Clone(config) };
        for (const auto& key : item.yaml_keys) {
            node = node[key];
            if (!node) {
                return;
            }
        }
        try {
            item = node.as<T>();
        } catch (const YAML::BadConversion&) {
            std::string str_value {};
            try {
                str_value = node.as<std::string>();
            } catch (const YAML::BadConversion&) {
                // Not a scalar, the message stays without the value
            }
            throw std::runtime_error { "cannot set " + item.keyToStr()
                                       + ", which is of type " + item.type
                                       + ", to the value " + str_value };
        }
    }
    // Configuration as a YAML string. Without a configuration file
    // this is the default configuration.
    auto c_str(const bool verbose = true) -> const char*;
    // Configuration as given by the user with defaults filled in
    auto getConfig() const -> std::string;
    virtual ~Settings() = default;
};

} // namespace lstmatch
