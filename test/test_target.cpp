#include <catch2/catch_test_macros.hpp>
#include <jv/json.h>
#include <jv/target.h>

#include <memory>
#include <string>
#include <vector>

using namespace jv;

namespace {

struct Point {
    int x = 0;
    int y = 0;
};

void from_json(const Value& v, Point& p) {
    jv::from_json(v.at("x"), p.x);
    jv::from_json(v.at("y"), p.y);
}

Value to_json(const Point& p) {
    Dictionary d;
    d["x"] = Value(p.x);
    d["y"] = Value(p.y);
    return Value(std::move(d));
}

} // namespace

TEST_CASE("Hooks for standard types", "[target]") {
    bool b = false;
    from_json(parse_json("true"), b);
    REQUIRE(b);

    int64_t i = 0;
    from_json(parse_json("-42"), i);
    REQUIRE(i == -42);

    uint64_t u = 0;
    from_json(parse_json("42"), u);
    REQUIRE(u == 42u);

    double d = 0;
    from_json(parse_json("0.5"), d);
    REQUIRE(d == 0.5);

    std::string s;
    from_json(parse_json(R"("str")"), s);
    REQUIRE(s == "str");

    std::vector<std::string> strings;
    from_json(parse_json(R"(["a","b"])"), strings);
    REQUIRE(strings == std::vector<std::string>{"a", "b"});
    REQUIRE(to_json(strings).dump() == R"(["a","b"])");
}

TEST_CASE("Hooks reject the wrong kind", "[target]") {
    std::string s;
    REQUIRE_THROWS_AS(from_json(parse_json("1"), s), TypeError);

    int small = 0;
    REQUIRE_THROWS_AS(from_json(parse_json("4294967296"), small), NumberError);
    from_json(parse_json("-2147483648"), small);
    REQUIRE(small == -2147483648LL);

    std::vector<int64_t> numbers{7};
    REQUIRE_THROWS_AS(from_json(parse_json(R"([1, "2"])"), numbers), TypeError);
    // the target is left untouched on failure
    REQUIRE(numbers == std::vector<int64_t>{7});
}

TEST_CASE("Typed wraps a caller type", "[target]") {
    Typed<Point> target;
    target.from_json(parse_json(R"({"x": 3, "y": -4, "z": 0})"));
    REQUIRE(target.get().x == 3);
    REQUIRE(target.get().y == -4);
    REQUIRE(target.to_json().dump() == R"({"x":3,"y":-4})");

    REQUIRE_THROWS_AS(target.from_json(parse_json("[]")), TypeError);
    REQUIRE(target.get().x == 3);
}

TEST_CASE("Typed over a vector of caller types", "[target]") {
    Typed<std::vector<Point>> target;
    target.from_json(parse_json(R"([{"x":1,"y":2},{"x":3,"y":4}])"));
    REQUIRE(target.get().size() == 2);
    REQUIRE(target.get()[1].y == 4);
    REQUIRE(target.to_json() == parse_json(R"([{"x":1,"y":2},{"x":3,"y":4}])"));
}

TEST_CASE("Factories build fresh targets", "[target][factory]") {
    auto factory = make_factory<Point>();
    auto a = factory();
    auto b = factory();
    REQUIRE(a);
    REQUIRE(a != b);
    REQUIRE(std::dynamic_pointer_cast<Typed<Point>>(a));

    SECTION("Default object target") {
        auto obj = default_object_factory()();
        obj->from_json(parse_json(R"({"k":[1]})"));
        REQUIRE(obj->to_json().dump() == R"({"k":[1]})");
        REQUIRE_THROWS_AS(obj->from_json(parse_json("[1]")), TypeError);
    }
    SECTION("Default array target") {
        auto arr = default_array_factory()();
        arr->from_json(parse_json(R"([{"k":1}, "s"])"));
        REQUIRE(arr->to_json().dump() == R"([{"k":1},"s"])");
        REQUIRE_THROWS_AS(arr->from_json(parse_json("{}")), TypeError);
    }
}
