#pragma once

#include <ig/dictionary.h>
#include <string>
#include <vector>

namespace ig {

// Set of value types named in a tag, e.g. "int or float" or "str or dict".
class TypeSet {
  public:
    enum Flag : unsigned {
        Str = 1u << 0,
        Dict = 1u << 1,
        Int = 1u << 2,
        Float = 1u << 3,
        Bool = 1u << 4,
    };

    TypeSet() = default;

    // Parse an "or"-joined list of type names. Names other than
    // str/dict/int/float/bool are remembered only as "has unknown".
    static TypeSet parse(const std::string& spec);

    bool empty() const noexcept { return mask_ == 0; }
    bool contains(Flag f) const noexcept { return (mask_ & f) != 0; }
    bool hasUnknown() const noexcept { return unknown_; }

    // Every name recognised and all of them numeric (int, float, bool).
    bool isNumeric() const noexcept;

    // bool: booleans only. int: integers, never booleans or doubles.
    // float: integers or doubles, never booleans. str / dict as expected.
    bool accepts(const Dictionary& value) const;

    // Runtime-type check for list elements: int matches integers and
    // booleans, float matches doubles only, bool booleans only.
    bool matchesElement(const Dictionary& value) const;

    std::string to_string() const;

    bool operator==(const TypeSet& rhs) const { return mask_ == rhs.mask_ && unknown_ == rhs.unknown_; }
    bool operator!=(const TypeSet& rhs) const { return !(*this == rhs); }

  private:
    unsigned mask_ = 0;
    bool unknown_ = false;
};

enum class TagModifier { None, Auto, Optional };

enum class TagBase { Text, Any, Numeric, List };

// Parsed form of the bracketed prefix of a schema string, e.g.
// "[int or float, optional] score". Tokens are trimmed and lower-cased.
struct Tag {
    std::vector<std::string> tokens;
    TagModifier modifier = TagModifier::None;
    TagBase base = TagBase::Text;
    // first token read as a type set ("str or dict" -> {str, dict})
    TypeSet types;
    // for TagBase::List, the set inside list[...]
    TypeSet element_types;

    bool skippable() const noexcept { return modifier != TagModifier::None; }
    bool has(const std::string& token) const;
    const std::string& first() const;

    static Tag parse(const std::string& text);
};

// Tokens of the bracketed tag at the start of `text`, empty if the text
// carries no tag.
std::vector<std::string> tag_tokens(const std::string& text);

}  // namespace ig
