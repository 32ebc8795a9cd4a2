#include "fetchcache/util/json-utils.hh"
#include "fetchcache/util/error.hh"
#include "fetchcache/util/types.hh"
#include "fetchcache/util/util.hh"

namespace fetchcache {

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

const nlohmann::json * getNullable(const nlohmann::json & value)
{
    return value.is_null() ? nullptr : &value;
}

/**
 * Ensure the type of a JSON object is what you expect, failing with a
 * ensure type if it isn't.
 *
 * Use before type conversions and element access to avoid ugly
 * exceptions, but only part of this module to define the other `get*`
 * functions.
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

const nlohmann::json::number_unsigned_t & getUnsigned(const nlohmann::json & value)
{
    if (auto ptr = value.get_ptr<const nlohmann::json::number_unsigned_t *>()) {
        return *ptr;
    }
    const char * typeName = value.type_name();
    if (value.is_number())
        typeName = value.is_number_float() ? "floating point number" : "signed integral number";
    throw Error(
        "Expected JSON value to be an unsigned integral number but it is of type '%s': %s", typeName, value.dump());
}

double getNumber(const nlohmann::json & value)
{
    if (!value.is_number())
        throw Error("Expected JSON value to be a number but it is of type '%s': %s", value.type_name(), value.dump());
    return value.get<double>();
}

Strings getStringList(const nlohmann::json & value)
{
    auto & jsonArray = getArray(value);

    Strings stringList;

    for (const auto & elem : jsonArray)
        stringList.push_back(getString(elem));

    return stringList;
}

} // namespace fetchcache
