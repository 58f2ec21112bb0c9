#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

std::string config_key_to_flag(const std::string& key) {
    std::string out = "--";
    for (size_t i = 0; i < key.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(key[i]);
        if (std::isupper(c)) {
            if (i > 0 && key[i - 1] != '-')
                out += '-';
            out += static_cast<char>(std::tolower(c));
        } else if (c == '_') {
            out += '-';
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (!node.IsScalar())
        return false;
    out = node.Scalar();
    return true;
}

static bool flatten_yaml(const YAML::Node& map, ConfigOptions& opts, ConfigLists& list_opts,
                         std::string& error) {
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        const std::string key = config_key_to_flag(it->first.as<std::string>());
        const YAML::Node& node = it->second;
        if (node.IsMap()) {
            if (!flatten_yaml(node, opts, list_opts, error))
                return false;
        } else if (node.IsSequence()) {
            auto& list = list_opts[key];
            list.clear();
            for (const auto& item : node) {
                std::string s;
                if (!to_string_value(item, s)) {
                    error = "List " + key + " must contain scalar values";
                    return false;
                }
                list.push_back(s);
            }
        } else {
            std::string s;
            if (to_string_value(node, s))
                opts[key] = s;
        }
    }
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool flatten_json(const nlohmann::json& obj, ConfigOptions& opts, ConfigLists& list_opts,
                         std::string& error) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string key = config_key_to_flag(it.key());
        const auto& val = it.value();
        if (val.is_object()) {
            if (!flatten_json(val, opts, list_opts, error))
                return false;
        } else if (val.is_array()) {
            auto& list = list_opts[key];
            list.clear();
            for (const auto& item : val) {
                std::string s;
                if (!to_string_value(item, s)) {
                    error = "List " + key + " must contain scalar values";
                    return false;
                }
                list.push_back(s);
            }
        } else {
            std::string s;
            if (to_string_value(val, s))
                opts[key] = s;
        }
    }
    return true;
}

bool load_yaml_config(const std::string& path, ConfigOptions& opts, ConfigLists& list_opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        return flatten_yaml(root, opts, list_opts, error);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigOptions& opts, ConfigLists& list_opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        return flatten_json(root, opts, list_opts, error);
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}
