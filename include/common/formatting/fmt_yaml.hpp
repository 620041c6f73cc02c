// File: common/formatting/fmt_yaml.hpp

#ifndef FMT_YAML_HPP
#define FMT_YAML_HPP

#include <fmt/format.h>
#include <string_view>
#include <yaml-cpp/yaml.h>

template<>
struct fmt::formatter<YAML::NodeType::value> : formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const YAML::NodeType::value type, FormatContext &ctx) const {
        std::string_view name = "Unknown";
        switch (type) {
            case YAML::NodeType::Null:
                name = "Null";
                break;
            case YAML::NodeType::Scalar:
                name = "Scalar";
                break;
            case YAML::NodeType::Sequence:
                name = "Sequence";
                break;
            case YAML::NodeType::Map:
                name = "Map";
                break;
            case YAML::NodeType::Undefined:
                name = "Undefined";
                break;
        }
        return formatter<std::string_view>::format(name, ctx);
    }
};

#endif // FMT_YAML_HPP
