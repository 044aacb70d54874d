#include "ociauth/util/json-utils.hh"

namespace ociauth {

const nlohmann::json & valueAt(const nlohmann::json::object_t & map, std::string_view key)
{
    if (auto * p = optionalValueAt(map, key))
        return *p;
    else
        throw Error("Expected JSON object to contain key '%s' but it doesn't: %s", key, nlohmann::json(map).dump());
}

const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & map, std::string_view key)
{
    auto i = map.find(std::string(key));
    if (i == map.end())
        return nullptr;
    return &i->second;
}

const nlohmann::json * nullableValueAt(const nlohmann::json::object_t & map, std::string_view key)
{
    auto * p = optionalValueAt(map, key);
    return p && !p->is_null() ? p : nullptr;
}

/**
 * Ensure the type of a JSON object is what you expect, failing with a
 * nice error if it isn't.
 */
static const nlohmann::json & ensureType(const nlohmann::json & value, nlohmann::json::value_type expectedType)
{
    if (value.type() != expectedType)
        throw Error(
            "Expected JSON value to be of type '%s' but it is of type '%s': %s",
            nlohmann::json(expectedType).type_name(),
            value.type_name(),
            value.dump());

    return value;
}

const nlohmann::json::object_t & getObject(const nlohmann::json & value)
{
    return ensureType(value, nlohmann::json::value_t::object).get_ref<const nlohmann::json::object_t &>();
}

const nlohmann::json::array_t & getArray(const nlohmann::json & value)
{
    return ensureType(value, nlohmann::json::value_t::array).get_ref<const nlohmann::json::array_t &>();
}

const nlohmann::json::string_t & getString(const nlohmann::json & value)
{
    return ensureType(value, nlohmann::json::value_t::string).get_ref<const nlohmann::json::string_t &>();
}

const nlohmann::json::boolean_t & getBoolean(const nlohmann::json & value)
{
    return ensureType(value, nlohmann::json::value_t::boolean).get_ref<const nlohmann::json::boolean_t &>();
}

Strings getStringList(const nlohmann::json & value)
{
    auto & jsonArray = getArray(value);

    Strings stringList;

    for (const auto & elem : jsonArray)
        stringList.push_back(getString(elem));

    return stringList;
}

StringMap getStringMap(const nlohmann::json & value)
{
    StringMap stringMap;

    for (const auto & [key, elem] : getObject(value))
        stringMap.insert_or_assign(key, getString(elem));

    return stringMap;
}

} // namespace ociauth
