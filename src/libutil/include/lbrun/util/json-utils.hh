#pragma once
///@file

#include <nlohmann/json.hpp>

#include <string_view>

namespace lbrun {

/**
 * The member `key` of `obj`, or `nullptr` if there is none.
 */
const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & obj, std::string_view key);

/**
 * The member `key` of `obj`. Throws `Error` if it is missing.
 */
const nlohmann::json & valueAt(const nlohmann::json::object_t & obj, std::string_view key);

const nlohmann::json * optionalValueAt(nlohmann::json::object_t && obj, std::string_view key) = delete;
const nlohmann::json & valueAt(nlohmann::json::object_t && obj, std::string_view key) = delete;

/**
 * Checked accessors. Throw `Error` naming the expected and actual type.
 */
const nlohmann::json::object_t & getObject(const nlohmann::json & value);
const nlohmann::json::string_t & getString(const nlohmann::json & value);

} // namespace lbrun
