#include <catch2/catch_test_macros.hpp>
#include <ig/tag.h>

using namespace ig;

TEST_CASE("Tag tokens are split, trimmed and lower-cased", "[tag]") {
    REQUIRE(tag_tokens("[int or float] score") == std::vector<std::string>{"int or float"});
    REQUIRE(tag_tokens("[ Str , OPTIONAL ] nickname") == std::vector<std::string>{"str", "optional"});
    REQUIRE(tag_tokens("[AUTO] id") == std::vector<std::string>{"auto"});
}

TEST_CASE("Tag ends at the first '] ' or else the last ']'", "[tag]") {
    REQUIRE(tag_tokens("[list[str]] aliases") == std::vector<std::string>{"list[str]"});
    REQUIRE(tag_tokens("[list[str]]") == std::vector<std::string>{"list[str]"});
    REQUIRE(tag_tokens("[int] count [approximate]") == std::vector<std::string>{"int"});
}

TEST_CASE("Strings without a leading tag have no tokens", "[tag]") {
    REQUIRE(tag_tokens("title text").empty());
    REQUIRE(tag_tokens("").empty());
    REQUIRE(tag_tokens("see [auto] below").empty());
    REQUIRE(tag_tokens("[unclosed tag").empty());
    REQUIRE(tag_tokens("  [int] indented") == std::vector<std::string>{"int"});
}

TEST_CASE("Modifiers", "[tag]") {
    REQUIRE(Tag::parse("[auto] id").modifier == TagModifier::Auto);
    REQUIRE(Tag::parse("[optional] note").modifier == TagModifier::Optional);
    REQUIRE(Tag::parse("[int, optional] count").modifier == TagModifier::Optional);
    // auto wins over optional wherever it appears
    REQUIRE(Tag::parse("[optional, auto] stamp").modifier == TagModifier::Auto);
    REQUIRE(Tag::parse("[int] count").modifier == TagModifier::None);
    REQUIRE_FALSE(Tag::parse("[autonomous] mode").skippable());
}

TEST_CASE("Base type comes from the first token", "[tag]") {
    SECTION("numeric sets") {
        auto t = Tag::parse("[int or float] score");
        REQUIRE(t.base == TagBase::Numeric);
        REQUIRE(t.types.contains(TypeSet::Int));
        REQUIRE(t.types.contains(TypeSet::Float));
        REQUIRE_FALSE(t.types.contains(TypeSet::Bool));
        REQUIRE(Tag::parse("[bool] flag").base == TagBase::Numeric);
        REQUIRE(Tag::parse("[float or bool or int] x").base == TagBase::Numeric);
    }

    SECTION("a single non-numeric name makes it text") {
        REQUIRE(Tag::parse("[int or str] id").base == TagBase::Text);
        REQUIRE(Tag::parse("[int or number] id").base == TagBase::Text);
        REQUIRE(Tag::parse("[str] name").base == TagBase::Text);
        REQUIRE(Tag::parse("plain description").base == TagBase::Text);
    }

    SECTION("any") { REQUIRE(Tag::parse("[any] payload").base == TagBase::Any); }

    SECTION("lists") {
        auto t = Tag::parse("[list[str or int]] values");
        REQUIRE(t.base == TagBase::List);
        REQUIRE(t.element_types.contains(TypeSet::Str));
        REQUIRE(t.element_types.contains(TypeSet::Int));
        REQUIRE(Tag::parse("[list[]] anything").element_types.empty());
    }
}

TEST_CASE("TypeSet acceptance rules", "[tag][typeset]") {
    auto ints = TypeSet::parse("int");
    auto floats = TypeSet::parse("float");
    auto bools = TypeSet::parse("bool");

    SECTION("int accepts integers only") {
        REQUIRE(ints.accepts(Dictionary(3)));
        REQUIRE_FALSE(ints.accepts(Dictionary(3.5)));
        REQUIRE_FALSE(ints.accepts(Dictionary(3.0)));
        REQUIRE_FALSE(ints.accepts(Dictionary(true)));
    }

    SECTION("float also accepts whole numbers") {
        REQUIRE(floats.accepts(Dictionary(3.5)));
        REQUIRE(floats.accepts(Dictionary(3)));
        REQUIRE_FALSE(floats.accepts(Dictionary(false)));
        REQUIRE_FALSE(floats.accepts(Dictionary("3.5")));
    }

    SECTION("bool accepts booleans only") {
        REQUIRE(bools.accepts(Dictionary(true)));
        REQUIRE_FALSE(bools.accepts(Dictionary(1)));
    }

    SECTION("str and dict") {
        auto mixed = TypeSet::parse("str or dict");
        REQUIRE(mixed.accepts(Dictionary("x")));
        REQUIRE(mixed.accepts(Dictionary()));
        REQUIRE_FALSE(mixed.accepts(Dictionary::array()));
        REQUIRE_FALSE(mixed.accepts(Dictionary::null()));
        REQUIRE(mixed.to_string() == "str or dict");
    }

    SECTION("list elements match on runtime type") {
        REQUIRE(ints.matchesElement(Dictionary(3)));
        REQUIRE(ints.matchesElement(Dictionary(true)));
        REQUIRE_FALSE(ints.matchesElement(Dictionary(3.0)));
        REQUIRE(floats.matchesElement(Dictionary(3.5)));
        REQUIRE_FALSE(floats.matchesElement(Dictionary(3)));
        REQUIRE_FALSE(bools.matchesElement(Dictionary(0)));
        REQUIRE(TypeSet::parse("str or dict").matchesElement(Dictionary()));
    }

    SECTION("unknown names are flagged but ignored") {
        auto t = TypeSet::parse("str or url");
        REQUIRE(t.hasUnknown());
        REQUIRE(t.contains(TypeSet::Str));
        REQUIRE_FALSE(t.isNumeric());
        REQUIRE(TypeSet::parse("url").empty());
    }
}
