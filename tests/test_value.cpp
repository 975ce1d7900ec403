/**
 * @file test_value.cpp
 * @brief Unit tests for the Value tree.
 */

#include <catch2/catch_test_macros.hpp>
#include <jsonb/value.hpp>

#include <cstring>

using namespace jsonb;

TEST_CASE("Value construction", "[value]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.kind() == Kind::Null);
        REQUIRE(v.size() == 0);
    }

    SECTION("scalars") {
        REQUIRE(Value::make_bool(true).as_bool());
        REQUIRE(Value::make_int(-5).as_int() == -5);
        REQUIRE(Value::make_float(2.5).as_float() == 2.5);
        REQUIRE(Value::make_text("abc").as_text() == "abc");

        REQUIRE(Value::make_bool(false).is_bool());
        REQUIRE(Value::make_int(0).is_int());
        REQUIRE(Value::make_float(0.0).is_float());
        REQUIRE(Value::make_text("").is_text());
    }

    SECTION("array") {
        Value v = Value::make_array({Value::make_int(1), Value::make_null()});
        REQUIRE(v.is_array());
        REQUIRE(v.size() == 2);
        REQUIRE(v.as_array()[0].as_int() == 1);
        REQUIRE(v.as_array()[1].is_null());
    }

    SECTION("object") {
        Object members;
        members.push_back(Member{"b", Value::make_int(2)});
        members.push_back(Member{"a", Value::make_int(1)});
        Value v = Value::make_object(std::move(members));

        REQUIRE(v.is_object());
        REQUIRE(v.size() == 2);
        REQUIRE(v.as_object()[0].key == "b");
        REQUIRE(v.as_object()[1].key == "a");
    }
}

TEST_CASE("Value find", "[value]") {
    Object members;
    members.push_back(Member{"name", Value::make_text("widget")});
    members.push_back(Member{"count", Value::make_int(3)});
    Value v = Value::make_object(std::move(members));

    const Value* count = v.find("count");
    REQUIRE(count != nullptr);
    REQUIRE(count->as_int() == 3);

    REQUIRE(v.find("missing") == nullptr);
    REQUIRE(Value::make_array({}).find("count") == nullptr);
}

TEST_CASE("Value equality", "[value]") {
    SECTION("kind must match") {
        REQUIRE(Value::make_int(1) != Value::make_float(1.0));
        REQUIRE(Value::make_null() != Value::make_bool(false));
        REQUIRE(Value::make_text("1") != Value::make_int(1));
    }

    SECTION("scalars compare by content") {
        REQUIRE(Value::make_null() == Value());
        REQUIRE(Value::make_int(7) == Value::make_int(7));
        REQUIRE(Value::make_int(7) != Value::make_int(8));
        REQUIRE(Value::make_text("x") == Value::make_text("x"));
    }

    SECTION("arrays compare element-wise") {
        Value a = Value::make_array({Value::make_int(1), Value::make_text("x")});
        Value b = Value::make_array({Value::make_int(1), Value::make_text("x")});
        Value c = Value::make_array({Value::make_text("x"), Value::make_int(1)});
        REQUIRE(a == b);
        REQUIRE(a != c);
    }

    SECTION("objects are order sensitive") {
        Object first;
        first.push_back(Member{"a", Value::make_int(1)});
        first.push_back(Member{"b", Value::make_int(2)});

        Object second;
        second.push_back(Member{"b", Value::make_int(2)});
        second.push_back(Member{"a", Value::make_int(1)});

        Value x = Value::make_object(first);
        Value y = Value::make_object(first);
        Value z = Value::make_object(second);
        REQUIRE(x == y);
        REQUIRE(x != z);
    }
}

TEST_CASE("Value kind names", "[value]") {
    REQUIRE(std::strcmp(Value().kind_name(), "null") == 0);
    REQUIRE(std::strcmp(Value::make_float(1.0).kind_name(), "float") == 0);
    REQUIRE(std::strcmp(kind_name(Kind::Object), "object") == 0);
}
