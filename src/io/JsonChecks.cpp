#include "io/JsonChecks.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace jsoncheck {

static bool present(const json& obj, const std::string& key) {
    return obj.contains(key) && !obj.at(key).is_null();
}

std::string at_index(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

std::string at_key(const std::string& where, const std::string& key) {
    return where + "." + key;
}

json parse(const std::string& text, const std::string& what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("failed to parse " + what + ": " + e.what());
    }
}

std::string read_file(const std::string& path, const std::string& what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open " + what + " file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void expect_object(const json& j, const std::string& where) {
    if (!j.is_object()) throw std::runtime_error(where + " must be an object");
}

void expect_array(const json& j, const std::string& where) {
    if (!j.is_array()) throw std::runtime_error(where + " must be an array");
}

const json& field(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + key);
    }
    return obj.at(key);
}

std::string string_field(const json& obj, const std::string& key, const std::string& where) {
    const json& v = field(obj, key, where);
    if (!v.is_string()) throw std::runtime_error(at_key(where, key) + " must be a string");
    return v.get<std::string>();
}

std::uint64_t uint_field(const json& obj, const std::string& key, const std::string& where) {
    const json& v = field(obj, key, where);
    if (!v.is_number_unsigned()) {
        throw std::runtime_error(at_key(where, key) + " must be a non-negative integer");
    }
    return v.get<std::uint64_t>();
}

std::vector<std::string> string_list_field(const json& obj, const std::string& key, const std::string& where) {
    const std::string path = at_key(where, key);
    const json& arr = field(obj, key, where);
    expect_array(arr, path);

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_string()) throw std::runtime_error(at_index(path, i) + " must be a string");
        out.push_back(arr[i].get<std::string>());
    }
    return out;
}

std::optional<std::string> opt_string(const json& obj, const std::string& key, const std::string& where) {
    if (!present(obj, key)) return std::nullopt;
    return string_field(obj, key, where);
}

void opt_number(const json& obj, const std::string& key, const std::string& where, double& out) {
    if (!present(obj, key)) return;
    if (!obj.at(key).is_number()) throw std::runtime_error(at_key(where, key) + " must be a number");
    out = obj.at(key).get<double>();
}

void opt_size(const json& obj, const std::string& key, const std::string& where, size_t& out) {
    if (!present(obj, key)) return;
    out = (size_t)uint_field(obj, key, where);
}

}
