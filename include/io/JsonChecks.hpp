#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Schema checks shared by the manifest and config readers. Every failure is
// a std::runtime_error naming the offending path, e.g.
// "root.documents[3].text must be a string".
namespace jsoncheck {

using json = nlohmann::json;

// "root.documents" + 3 -> "root.documents[3]"
std::string at_index(const std::string& where, size_t i);

// "config.index" + "rebuild_threshold" -> "config.index.rebuild_threshold"
std::string at_key(const std::string& where, const std::string& key);

json parse(const std::string& text, const std::string& what);
std::string read_file(const std::string& path, const std::string& what);

void expect_object(const json& j, const std::string& where);
void expect_array(const json& j, const std::string& where);

// required fields
const json& field(const json& obj, const std::string& key, const std::string& where);
std::string string_field(const json& obj, const std::string& key, const std::string& where);
std::uint64_t uint_field(const json& obj, const std::string& key, const std::string& where);
std::vector<std::string> string_list_field(const json& obj, const std::string& key, const std::string& where);

// optional fields: absent (or null) leaves the default / returns nullopt
std::optional<std::string> opt_string(const json& obj, const std::string& key, const std::string& where);
void opt_number(const json& obj, const std::string& key, const std::string& where, double& out);
void opt_size(const json& obj, const std::string& key, const std::string& where, size_t& out);

}
