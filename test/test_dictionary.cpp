#include <catch2/catch_test_macros.hpp>
#include <ig/dictionary.h>
#include <sstream>

using namespace ig;

TEST_CASE("Object keys keep insertion order", "[dictionary]") {
    Dictionary d;
    d["zeta"] = 1;
    d["alpha"] = 2;
    d["mid"] = 3;
    REQUIRE(d.keys() == std::vector<std::string>{"zeta", "alpha", "mid"});

    SECTION("re-assigning a key keeps its position") {
        d["zeta"] = "changed";
        REQUIRE(d.keys() == std::vector<std::string>{"zeta", "alpha", "mid"});
        REQUIRE(d.at("zeta").asString() == "changed");
        REQUIRE(d.size() == 3);
    }
}

TEST_CASE("Scalar types are distinguished", "[dictionary]") {
    REQUIRE(Dictionary(3).isInt());
    REQUIRE_FALSE(Dictionary(3).isDouble());
    REQUIRE(Dictionary(3.0).isDouble());
    REQUIRE(Dictionary(true).isBool());
    REQUIRE_FALSE(Dictionary(true).isInt());
    REQUIRE(Dictionary("x").isString());
    REQUIRE(Dictionary::null().isNull());
    REQUIRE(Dictionary().isMappedObject());
    REQUIRE(Dictionary::array().isArrayObject());
    REQUIRE(Dictionary::array().empty());
}

TEST_CASE("Typed accessors reject the wrong type", "[dictionary]") {
    Dictionary d(5);
    REQUIRE(d.asInt() == 5);
    REQUIRE(d.asDouble() == 5.0);
    REQUIRE_THROWS_AS(d.asString(), std::runtime_error);
    REQUIRE_THROWS_AS(d.asBool(), std::runtime_error);
    REQUIRE_THROWS_AS(Dictionary(5.5).asInt(), std::runtime_error);
}

TEST_CASE("Missing key error lists available keys", "[dictionary]") {
    Dictionary d{{"name", "x"}, {"port", 80}};
    try {
        (void)d.at("nmae");
        FAIL("expected out_of_range");
    } catch (const std::out_of_range& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("nmae") != std::string::npos);
        REQUIRE(msg.find("\"name\",\"port\"") != std::string::npos);
    }
}

TEST_CASE("Arrays", "[dictionary]") {
    Dictionary d = Dictionary::array();
    d.push_back(1);
    d.push_back("two");
    d.push_back(Dictionary{{"three", 3}});
    REQUIRE(d.size() == 3);
    REQUIRE(d.at(1).asString() == "two");
    REQUIRE(d[2].at("three").asInt() == 3);
    REQUIRE_THROWS_AS(d.at(3), std::out_of_range);
    REQUIRE_THROWS_AS(d.at("key"), std::out_of_range);

    Dictionary scalar("text");
    REQUIRE_THROWS_AS(scalar.push_back(1), std::logic_error);
}

TEST_CASE("Equality ignores key order", "[dictionary]") {
    Dictionary a{{"x", 1}, {"y", "two"}};
    Dictionary b{{"y", "two"}, {"x", 1}};
    REQUIRE(a == b);
    REQUIRE(Dictionary(1) != Dictionary(1.0));
    REQUIRE(Dictionary(std::vector<Dictionary>{1, 2}) != Dictionary(std::vector<Dictionary>{2, 1}));
}

TEST_CASE("dump writes JSON in insertion order", "[dictionary][dump]") {
    Dictionary d;
    d["b"] = "quote\"d";
    d["a"] = std::vector<Dictionary>{1, 2.5, true, Dictionary::null()};
    d["c"] = Dictionary();
    REQUIRE(d.dump() == R"({"b":"quote\"d","a":[1,2.5,true,null],"c":{}})");

    SECTION("whole doubles stay doubles") { REQUIRE(Dictionary(2.0).dump() == "2.0"); }

    SECTION("streaming writes compact JSON") {
        std::ostringstream os;
        os << d.at("a");
        REQUIRE(os.str() == "[1,2.5,true,null]");
    }

    SECTION("indented") {
        Dictionary small{{"k", std::vector<Dictionary>{1}}};
        REQUIRE(small.dump(2) == "{\n  \"k\": [\n    1\n  ]\n}");
    }
}
