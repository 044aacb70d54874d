#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ociauth/util/error.hh"
#include "ociauth/util/json-utils.hh"
#include "ociauth/util/tests/gmock-matchers.hh"

namespace ociauth {

TEST(valueAt, simpleObject)
{
    auto simple = R"({ "hello": "world" })"_json;

    ASSERT_EQ(valueAt(getObject(simple), "hello"), "world");

    auto nested = R"({ "hello": { "world": "" } })"_json;

    auto & nestedObject = valueAt(getObject(nested), "hello");

    ASSERT_EQ(valueAt(getObject(nestedObject), "world"), "");
}

TEST(valueAt, missingKey)
{
    auto json = R"({ "hello": { "nested": "world" } })"_json;

    auto & obj = getObject(json);

    ASSERT_THROW(valueAt(obj, "foo"), Error);
}

TEST(optionalValueAt, existing)
{
    auto json = R"({ "string": "ssh-rsa", "null": null })"_json;

    ASSERT_NE(optionalValueAt(getObject(json), "string"), nullptr);
    ASSERT_EQ(*optionalValueAt(getObject(json), "string"), "ssh-rsa");
    ASSERT_NE(optionalValueAt(getObject(json), "null"), nullptr);
}

TEST(optionalValueAt, empty)
{
    auto json = R"({})"_json;

    ASSERT_EQ(optionalValueAt(getObject(json), "string"), nullptr);
}

TEST(nullableValueAt, nullIsAbsent)
{
    auto json = R"({ "string": "ssh-rsa", "null": null })"_json;

    ASSERT_NE(nullableValueAt(getObject(json), "string"), nullptr);
    ASSERT_EQ(nullableValueAt(getObject(json), "null"), nullptr);
    ASSERT_EQ(nullableValueAt(getObject(json), "absent"), nullptr);
}

TEST(getObject, rightAssertions)
{
    auto simple = R"({ "object": {} })"_json;

    ASSERT_EQ(getObject(valueAt(getObject(simple), "object")), (nlohmann::json::object_t{}));
}

TEST(getObject, wrongAssertions)
{
    auto json = R"({ "object": {}, "array": [], "string": "", "boolean": true })"_json;

    auto & obj = getObject(json);

    ASSERT_THROW(getObject(valueAt(obj, "array")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "string")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "boolean")), Error);
}

TEST(getArray, rightAssertions)
{
    auto simple = R"({ "array": [] })"_json;

    ASSERT_EQ(getArray(valueAt(getObject(simple), "array")), (nlohmann::json::array_t{}));
}

TEST(getString, wrongAssertions)
{
    auto json = R"({ "object": {}, "array": [], "string": "", "boolean": true })"_json;

    auto & obj = getObject(json);

    ASSERT_THROW(getString(valueAt(obj, "object")), Error);
    ASSERT_THROW(getString(valueAt(obj, "array")), Error);
    ASSERT_THROW(getString(valueAt(obj, "boolean")), Error);
}

TEST(getString, errorMessageNamesTypes)
{
    auto json = R"(42)"_json;
    EXPECT_THAT(
        [&]() { getString(json); },
        ::testing::ThrowsMessage<Error>(
            testing::HasSubstrIgnoreANSI("Expected JSON value to be of type 'string' but it is of type 'number'")));
}

TEST(getBoolean, rightAssertions)
{
    auto simple = R"({ "boolean": false })"_json;

    ASSERT_EQ(getBoolean(valueAt(getObject(simple), "boolean")), false);
}

TEST(getStringList, works)
{
    EXPECT_EQ(getStringList(R"(["a", "b"])"_json), (Strings{"a", "b"}));
    EXPECT_EQ(getStringList(R"([])"_json), Strings{});
    EXPECT_THROW(getStringList(R"(["a", 1])"_json), Error);
}

TEST(getStringMap, works)
{
    EXPECT_EQ(getStringMap(R"({"a": "1", "b": "2"})"_json), (StringMap{{"a", "1"}, {"b", "2"}}));
    EXPECT_THROW(getStringMap(R"({"a": null})"_json), Error);
}

} // namespace ociauth
