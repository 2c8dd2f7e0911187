// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A configuration parameter is an instance of Setting<T>. Besides the
// value it stores the chain of YAML keys that locate the parameter in
// a configuration file, a description, and a string representation
// of its type. For example, the section
//
//   matchup:
//     match_tolerance: 1.0
//
// is represented by
//
//   Setting<double> match_tolerance {
//       { "matchup", "match_tolerance" }, 1.0, "description" };
//
// Primitive values are held in the value member, but Setting<T>
// converts to T implicitly so that
//
//   if (std::abs(offset) <= settings.matchup.match_tolerance) {
//
// works as expected. Strings, lists and optional values inherit from
// the corresponding standard type so that they can be used directly,
// e.g. settings.stations.filters.size().

#pragma once

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lstmatch {

// Holds everything except the value: the YAML location of the
// parameter, its description and its type name for printing.
template <typename T>
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    const std::string info {};
    std::string type {};

    SettingBase() = default;
    SettingBase(const bool is_list,
                const std::vector<std::string>& yaml_keys,
                const std::string& info)
      : yaml_keys { yaml_keys }, info { info }
    {
        const std::string suffix { is_list ? " list" : "" };
        if constexpr (std::is_same_v<T, bool>) {
            type = "boolean" + suffix;
        } else if constexpr (std::is_same_v<T, int>) {
            type = "integer" + suffix;
        } else if constexpr (std::is_same_v<T, size_t>) {
            type = "unsigned integer" + suffix;
        } else if constexpr (std::is_same_v<T, double>) {
            type = "double (float64)" + suffix;
        } else if constexpr (std::is_same_v<T, std::string>) {
            type = "string" + suffix;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            type = "string list" + suffix;
        } else {
            throw std::domain_error {
                "type not supported by the Setting class, add a type name "
                "for it in SettingBase"
            };
        }
    }
    // Return the YAML keys in the form [a][b]...
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::stringstream s {};
        for (const auto& key : yaml_keys) {
            s << '[' << key << ']';
        }
        return s.str();
    }
    ~SettingBase() = default;
};

// Primitive types
template <typename T>
class Setting : public SettingBase<T>
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, value { value }
    {}

    operator T() const { return value; }
    auto operator=(const T& value) -> Setting<T>&
    {
        this->value = value;
        return *this;
    }

    ~Setting() = default;
};

// List of values. The assignment operator acts on the std::vector
// base.
template <typename T>
class Setting<std::vector<T>>
  : public SettingBase<T>
  , public std::vector<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T> value,
            const std::string& info)
      : SettingBase<T> { true, yaml_keys, info }, std::vector<T> { value }
    {}
    auto operator=(const std::vector<T>& value) -> Setting<std::vector<T>>&
    {
        std::vector<T>* base { this };
        *base = value;
        return *this;
    }
};

// Parameter without a sensible default. Whether the user must set it
// is decided in checkParameters, not here. The type name is that of
// T.
template <typename T>
class Setting<std::optional<T>>
  : public SettingBase<T>
  , public std::optional<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys, const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, std::optional<T> {}
    {}
    auto operator=(const std::optional<T>& value) -> Setting<std::optional<T>>&
    {
        std::optional<T>* base { this };
        *base = value;
        return *this;
    }
};

template <>
class Setting<std::string>
  : public SettingBase<std::string>
  , public std::string
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string value,
            const std::string& info)
      : SettingBase<std::string> { false, yaml_keys, info }
      , std::string { value }
    {}
    auto operator=(const std::string& value) -> Setting<std::string>&
    {
        std::string* base { this };
        *base = value;
        return *this;
    }
};

} // namespace lstmatch
