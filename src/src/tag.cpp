#include <ig/tag.h>
#include <algorithm>
#include <cctype>

namespace ig {

namespace {
    std::string trim(const std::string& s) {
        size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::vector<std::string> split(const std::string& s, const std::string& sep) {
        std::vector<std::string> out;
        size_t pos = 0;
        while (true) {
            size_t next = s.find(sep, pos);
            if (next == std::string::npos) {
                out.push_back(s.substr(pos));
                break;
            }
            out.push_back(s.substr(pos, next - pos));
            pos = next + sep.size();
        }
        return out;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }
}  // namespace

TypeSet TypeSet::parse(const std::string& spec) {
    TypeSet out;
    for (auto const& part : split(spec, " or ")) {
        std::string name = lower(trim(part));
        if (name == "str")
            out.mask_ |= Str;
        else if (name == "dict")
            out.mask_ |= Dict;
        else if (name == "int")
            out.mask_ |= Int;
        else if (name == "float")
            out.mask_ |= Float;
        else if (name == "bool")
            out.mask_ |= Bool;
        else
            out.unknown_ = true;
    }
    return out;
}

bool TypeSet::isNumeric() const noexcept {
    return !empty() && !unknown_ && (mask_ & ~(Int | Float | Bool)) == 0;
}

bool TypeSet::accepts(const Dictionary& value) const {
    if (contains(Bool) && value.isBool()) return true;
    if (contains(Int) && value.isInt()) return true;
    if (contains(Float) && (value.isInt() || value.isDouble())) return true;
    if (contains(Str) && value.isString()) return true;
    if (contains(Dict) && value.isMappedObject()) return true;
    return false;
}

bool TypeSet::matchesElement(const Dictionary& value) const {
    if (contains(Bool) && value.isBool()) return true;
    if (contains(Int) && (value.isInt() || value.isBool())) return true;
    if (contains(Float) && value.isDouble()) return true;
    if (contains(Str) && value.isString()) return true;
    if (contains(Dict) && value.isMappedObject()) return true;
    return false;
}

std::string TypeSet::to_string() const {
    static const std::pair<Flag, const char*> names[] = {
                {Str, "str"}, {Dict, "dict"}, {Int, "int"}, {Float, "float"}, {Bool, "bool"}};
    std::string out;
    for (auto const& n : names) {
        if (!contains(n.first)) continue;
        if (!out.empty()) out += " or ";
        out += n.second;
    }
    return out;
}

std::vector<std::string> tag_tokens(const std::string& text) {
    size_t open = 0;
    while (open < text.size() && std::isspace(static_cast<unsigned char>(text[open]))) ++open;
    if (open >= text.size() || text[open] != '[') return {};

    // The tag ends at the first "] ". Without a description after it, the
    // last ']' closes it, which keeps "[list[str]]" intact.
    size_t close = text.find("] ", open + 1);
    if (close == std::string::npos) close = text.rfind(']');
    if (close == std::string::npos || close <= open) return {};

    std::vector<std::string> tokens;
    for (auto const& part : split(text.substr(open + 1, close - open - 1), ",")) {
        tokens.push_back(lower(trim(part)));
    }
    return tokens;
}

bool Tag::has(const std::string& token) const {
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

const std::string& Tag::first() const {
    static const std::string none;
    return tokens.empty() ? none : tokens.front();
}

Tag Tag::parse(const std::string& text) {
    Tag tag;
    tag.tokens = tag_tokens(text);

    if (tag.has("auto"))
        tag.modifier = TagModifier::Auto;
    else if (tag.has("optional"))
        tag.modifier = TagModifier::Optional;

    const std::string& head = tag.first();
    tag.types = TypeSet::parse(head);
    if (starts_with(head, "list[")) {
        tag.base = TagBase::List;
        std::string inner = head.substr(5);
        if (!inner.empty() && inner.back() == ']') inner.pop_back();
        if (!trim(inner).empty()) tag.element_types = TypeSet::parse(inner);
    } else if (head == "any") {
        tag.base = TagBase::Any;
    } else if (tag.types.isNumeric()) {
        tag.base = TagBase::Numeric;
    } else {
        tag.base = TagBase::Text;
    }
    return tag;
}

}  // namespace ig
