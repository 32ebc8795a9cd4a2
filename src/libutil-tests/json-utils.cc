#include <gtest/gtest.h>

#include "fetchcache/util/error.hh"
#include "fetchcache/util/json-utils.hh"

namespace fetchcache {

TEST(valueAt, simpleObject)
{
    auto simple = R"({ "hello": "world" })"_json;

    ASSERT_EQ(valueAt(getObject(simple), "hello"), "world");

    auto nested = R"({ "hello": { "world": "" } })"_json;

    ASSERT_EQ(valueAt(getObject(valueAt(getObject(nested), "hello")), "world"), "");
}

TEST(valueAt, missingKey)
{
    auto json = R"({ "hello": { "nested": "world" } })"_json;

    auto & obj = getObject(json);

    ASSERT_THROW(valueAt(obj, "foo"), Error);
}

TEST(getObject, rightAssertions)
{
    auto simple = R"({ "object": {} })"_json;

    ASSERT_EQ(getObject(valueAt(getObject(simple), "object")), (nlohmann::json::object_t{}));
}

TEST(getObject, wrongAssertions)
{
    auto json = R"({ "object": {}, "array": [], "string": "", "int": 0, "boolean": false })"_json;

    auto & obj = getObject(json);

    ASSERT_THROW(getObject(valueAt(obj, "array")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "string")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "int")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "boolean")), Error);
}

TEST(getArray, wrongAssertions)
{
    auto json = R"({ "object": {}, "array": [], "string": "", "int": 0, "boolean": false })"_json;

    auto & obj = getObject(json);

    ASSERT_EQ(getArray(valueAt(obj, "array")), (nlohmann::json::array_t{}));
    ASSERT_THROW(getArray(valueAt(obj, "object")), Error);
    ASSERT_THROW(getArray(valueAt(obj, "string")), Error);
}

TEST(getString, wrongAssertions)
{
    auto json = R"({ "object": {}, "array": [], "string": "", "int": 0, "boolean": false })"_json;

    auto & obj = getObject(json);

    ASSERT_EQ(getString(valueAt(obj, "string")), "");
    ASSERT_THROW(getString(valueAt(obj, "object")), Error);
    ASSERT_THROW(getString(valueAt(obj, "int")), Error);
    ASSERT_THROW(getString(valueAt(obj, "boolean")), Error);
}

TEST(getUnsigned, wrongAssertions)
{
    auto json = R"({ "int": 1, "signed": -1, "float": 1.5, "string": "1" })"_json;

    auto & obj = getObject(json);

    ASSERT_EQ(getUnsigned(valueAt(obj, "int")), 1u);
    ASSERT_THROW(getUnsigned(valueAt(obj, "signed")), Error);
    ASSERT_THROW(getUnsigned(valueAt(obj, "float")), Error);
    ASSERT_THROW(getUnsigned(valueAt(obj, "string")), Error);
}

TEST(getNumber, integersAndFloats)
{
    auto json = R"({ "int": 12, "float": 0.25, "string": "12" })"_json;

    auto & obj = getObject(json);

    ASSERT_EQ(getNumber(valueAt(obj, "int")), 12.0);
    ASSERT_EQ(getNumber(valueAt(obj, "float")), 0.25);
    ASSERT_THROW(getNumber(valueAt(obj, "string")), Error);
}

TEST(getStringList, strings)
{
    auto json = R"(["linux", "windows"])"_json;

    ASSERT_EQ(getStringList(json), (Strings{"linux", "windows"}));
}

TEST(getStringList, nonStringElement)
{
    auto json = R"(["linux", 3])"_json;

    ASSERT_THROW(getStringList(json), Error);
}

TEST(optionalValueAt, existing)
{
    auto json = R"({ "string": "ssh-rsa" })"_json;

    auto * ptr = optionalValueAt(getObject(json), "string");
    ASSERT_TRUE(ptr);
    ASSERT_EQ(*ptr, R"("ssh-rsa")"_json);
}

TEST(optionalValueAt, empty)
{
    auto json = R"({})"_json;

    ASSERT_EQ(optionalValueAt(getObject(json), "string"), nullptr);
}

TEST(getNullable, null)
{
    auto json = R"(null)"_json;

    ASSERT_EQ(getNullable(json), nullptr);
}

TEST(getNullable, empty)
{
    auto json = R"({})"_json;

    auto * p = getNullable(json);

    ASSERT_NE(p, nullptr);
    ASSERT_EQ(*p, R"({})"_json);
}

} // namespace fetchcache
