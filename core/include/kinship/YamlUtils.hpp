#ifndef KINSHIP_YAML_UTILS_HPP
#define KINSHIP_YAML_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wshadow"
#endif
#include <yaml-cpp/yaml.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

namespace kin::detail {

struct YamlSeq {
    YAML::Emitter& out;

    YamlSeq(YAML::Emitter& out_) : out(out_) { out << YAML::BeginSeq; }

    ~YamlSeq() { out << YAML::EndSeq; }

    template<typename F>
    requires std::is_invocable_v<F>
    void writeFn(F&& fun) {
        fun();
    }
};

struct YamlMap {
    YAML::Emitter& out;

    YamlMap(YAML::Emitter& out_) : out(out_) { out << YAML::BeginMap; }

    ~YamlMap() { out << YAML::EndMap; }

    template<typename T>
    void write(std::string_view key, const T& value) {
        out << YAML::Key << std::string(key);
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            out << YAML::Value << std::string(std::string_view(value));
        } else {
            out << YAML::Value << value;
        }
    }

    /// absent values are omitted from the document
    template<typename T>
    void write(std::string_view key, const std::optional<T>& value) {
        if (value) {
            write(key, *value);
        }
    }

    template<typename F>
    void writeFn(std::string_view key, F&& fun) {
        out << YAML::Key << std::string(key);
        out << YAML::Value;
        fun();
    }
};

/// value of `key` in `node`, std::nullopt if missing or null
/// @throws YAML::BadConversion if the value cannot be converted to `T`
template<typename T>
[[nodiscard]] std::optional<T> optionalValue(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    return value.as<T>();
}

} // namespace kin::detail

#endif // KINSHIP_YAML_UTILS_HPP
