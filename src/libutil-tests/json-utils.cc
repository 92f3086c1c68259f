#include <gtest/gtest.h>

#include "lbrun/util/error.hh"
#include "lbrun/util/json-utils.hh"

namespace lbrun {

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
    auto json = R"({ "string": "ssh-rsa" })"_json;

    auto * value = optionalValueAt(getObject(json), "string");
    ASSERT_NE(value, nullptr);
    ASSERT_EQ(*value, "ssh-rsa");
}

TEST(optionalValueAt, empty)
{
    auto json = R"({})"_json;

    ASSERT_EQ(optionalValueAt(getObject(json), "string"), nullptr);
}

TEST(getObject, rightAssertions)
{
    auto simple = R"({ "object": {} })"_json;

    ASSERT_EQ(getObject(valueAt(getObject(simple), "object")), (nlohmann::json::object_t{}));

    auto nested = R"({ "object": { "object": {} } })"_json;

    auto & nestedObject = getObject(valueAt(getObject(nested), "object"));

    ASSERT_EQ(nestedObject, getObject(nlohmann::json::parse(R"({ "object": {} })")));
    ASSERT_EQ(getObject(valueAt(nestedObject, "object")), (nlohmann::json::object_t{}));
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

TEST(getString, rightAssertions)
{
    auto simple = R"({ "string": "" })"_json;
    ASSERT_EQ(getString(valueAt(getObject(simple), "string")), "");
}

TEST(getString, wrongAssertions)
{
    auto json = R"({ "object": {}, "array": [], "string": "", "int": 0, "boolean": false })"_json;

    auto & obj = getObject(json);

    ASSERT_THROW(getString(valueAt(obj, "object")), Error);
    ASSERT_THROW(getString(valueAt(obj, "array")), Error);
    ASSERT_THROW(getString(valueAt(obj, "int")), Error);
    ASSERT_THROW(getString(valueAt(obj, "boolean")), Error);
}

} // namespace lbrun
