#pragma once
///@file

#include <nlohmann/json.hpp>

#include "ociauth/util/error.hh"
#include "ociauth/util/types.hh"

namespace ociauth {

/**
 * Get the value of a json object at a key safely, failing with a nice
 * error if the key does not exist.
 *
 * Use instead of nlohmann::json::at() to avoid ugly exceptions.
 */
const nlohmann::json & valueAt(const nlohmann::json::object_t & map, std::string_view key);

/**
 * @return A pointer to the value assiocated with `key` if `value`
 * contains `key`, otherwise return `nullptr` (not JSON `null`!).
 */
const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & value, std::string_view key);

/**
 * Prevents bugs with dangling references into temporaries.
 */
const nlohmann::json & valueAt(nlohmann::json::object_t && map, std::string_view key) = delete;
const nlohmann::json * optionalValueAt(nlohmann::json::object_t && value, std::string_view key) = delete;

/**
 * Like `optionalValueAt()`, but JSON `null` also counts as absent.
 */
const nlohmann::json * nullableValueAt(const nlohmann::json::object_t & value, std::string_view key);

/**
 * Downcast the json object, failing with a nice error if the conversion fails.
 * See https://json.nlohmann.me/features/types/
 */
const nlohmann::json::object_t & getObject(const nlohmann::json & value);
const nlohmann::json::array_t & getArray(const nlohmann::json & value);
const nlohmann::json::string_t & getString(const nlohmann::json & value);
const nlohmann::json::boolean_t & getBoolean(const nlohmann::json & value);
Strings getStringList(const nlohmann::json & value);
StringMap getStringMap(const nlohmann::json & value);

} // namespace ociauth
