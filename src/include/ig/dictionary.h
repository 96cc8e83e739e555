#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ig {

struct DictionaryScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
};

// JSON-like value. Objects keep their keys in insertion order so that
// schema fields are walked in the order they were declared.
struct Dictionary {
    enum TYPE { Object, Boolean, String, Integer, Double, Array, Null };

    using Item = std::pair<std::string, Dictionary>;

  private:
    TYPE my_type = Object;
    DictionaryScalarImpl scalar;

    std::vector<Dictionary> m_array;
    std::vector<Item> m_items;
    std::map<std::string, size_t> m_index;

  public:
    Dictionary() = default;

    Dictionary(const std::string& s) {
        my_type = TYPE::String;
        scalar.m_string = s;
    }

    Dictionary(std::string&& s) {
        my_type = TYPE::String;
        scalar.m_string = std::move(s);
    }

    Dictionary(const char* s) : Dictionary(std::string(s)) {}

    Dictionary(int64_t n) {
        my_type = TYPE::Integer;
        scalar.m_int = n;
    }

    Dictionary(int n) : Dictionary(int64_t(n)) {}

    Dictionary(double x) {
        my_type = TYPE::Double;
        scalar.m_double = x;
    }

    Dictionary(bool b) {
        my_type = TYPE::Boolean;
        scalar.m_bool = b;
    }

    Dictionary(std::vector<Dictionary> v) {
        my_type = TYPE::Array;
        m_array = std::move(v);
    }

    // Construct an object from initializer list of (key, value) pairs
    Dictionary(std::initializer_list<Item> init) {
        my_type = TYPE::Object;
        for (auto const& p : init) (*this)[p.first] = p.second;
    }

    static Dictionary null() {
        Dictionary d;
        d.my_type = TYPE::Null;
        return d;
    }

    static Dictionary array() { return Dictionary(std::vector<Dictionary>{}); }

    bool operator==(const Dictionary& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::Double:
                return scalar.m_double == rhs.scalar.m_double;
            case TYPE::Integer:
                return scalar.m_int == rhs.scalar.m_int;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object: {
                // key order does not take part in equality
                if (m_items.size() != rhs.m_items.size()) return false;
                for (auto const& p : m_items) {
                    if (!rhs.has(p.first)) return false;
                    if (p.second != rhs.at(p.first)) return false;
                }
                return true;
            }
            case TYPE::Null:
                return true;
        }
        return false;
    }

    bool operator!=(const Dictionary& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_index.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_items.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept {
        switch (my_type) {
            case TYPE::Object:
                return m_items.empty();
            case TYPE::Array:
                return m_array.empty();
            default:
                return false;
        }
    }

    TYPE type() const { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "Object";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Double:
                return "Double";
            case TYPE::Integer:
                return "Integer";
            case TYPE::String:
                return "String";
            case TYPE::Array:
                return "Array";
            case TYPE::Null:
                return "Null";
        }
        throw std::logic_error("Not a valid type");
    }

    // Insert-or-access. A non-object value is turned into an empty object
    // first, matching how builders use `d["key"] = ...`.
    Dictionary& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            my_type = TYPE::Object;
            m_items.clear();
            m_index.clear();
            m_array.clear();
        }
        auto it = m_index.find(k);
        if (it != m_index.end()) return m_items[it->second].second;
        m_index.emplace(k, m_items.size());
        m_items.emplace_back(k, Dictionary());
        return m_items.back().second;
    }

    const Dictionary& operator[](const std::string& k) const { return at(k); }

    const Dictionary& operator[](int index) const { return at(index); }

    Dictionary& push_back(Dictionary value) {
        if (my_type != TYPE::Array) {
            if (my_type == TYPE::Object && m_items.empty()) {
                my_type = TYPE::Array;
            } else {
                throw std::logic_error("Not a list");
            }
        }
        m_array.push_back(std::move(value));
        return m_array.back();
    }

    const Dictionary& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0 || static_cast<size_t>(index) >= m_array.size()) {
            throw std::out_of_range("Index " + std::to_string(index) + " out of range for list of size " +
                                    std::to_string(m_array.size()));
        }
        return m_array[static_cast<size_t>(index)];
    }

    const Dictionary& at(const std::string& k) const {
        auto it = m_index.find(k);
        if (my_type == TYPE::Object && it != m_index.end()) return m_items[it->second].second;

        // didn't find it, throw a decent error message
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_items) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        throw std::out_of_range(ss.str());
    }

    // Keys in insertion order
    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) return {};
        std::vector<std::string> out;
        out.reserve(m_items.size());
        for (auto const& p : m_items) out.push_back(p.first);
        return out;
    }

    const std::vector<Item>& items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        return m_items;
    }

    const std::vector<Dictionary>& elements() const {
        if (my_type != TYPE::Array) {
            throw std::logic_error("Cannot get elements of non-array type");
        }
        return m_array;
    }

    std::string asString() const {
        if (my_type == TYPE::String) return scalar.m_string;
        throw std::runtime_error("not a string");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar.m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar.m_bool;
        throw std::runtime_error("not a bool");
    }

    bool isMappedObject() const { return my_type == TYPE::Object; }
    bool isArrayObject() const { return my_type == TYPE::Array; }

    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }

    std::string dump(int indent = 0) const;

    std::string to_string() const {
        if (my_type == TYPE::String) return scalar.m_string;
        return dump();
    }
};

// Helper function to escape JSON strings
inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    result += "\\u00";
                    result.push_back(hex[(c >> 4) & 0x0F]);
                    result.push_back(hex[c & 0x0F]);
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

// indent == 0 gives single-line compact JSON, otherwise objects and arrays
// are expanded one member per line.
inline std::string Dictionary::dump(int indent) const {
    std::ostringstream out;

    std::function<void(const Dictionary&, int)> dumpValue;
    dumpValue = [&](const Dictionary& val, int level) {
        auto newline = [&](int lvl) {
            if (indent > 0) out << '\n' << std::string(static_cast<size_t>(lvl), ' ');
        };
        switch (val.my_type) {
            case TYPE::Null:
                out << "null";
                return;
            case TYPE::Boolean:
                out << (val.scalar.m_bool ? "true" : "false");
                return;
            case TYPE::Integer:
                out << val.scalar.m_int;
                return;
            case TYPE::Double: {
                std::ostringstream ss;
                ss.precision(15);
                ss << val.scalar.m_double;
                std::string s = ss.str();
                // keep doubles recognisable as doubles when re-parsed
                if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
                out << s;
                return;
            }
            case TYPE::String:
                out << escape_json_string(val.scalar.m_string);
                return;
            case TYPE::Array: {
                if (val.m_array.empty()) {
                    out << "[]";
                    return;
                }
                out << '[';
                for (size_t i = 0; i < val.m_array.size(); ++i) {
                    if (i) out << ',';
                    newline(level + indent);
                    dumpValue(val.m_array[i], level + indent);
                }
                newline(level);
                out << ']';
                return;
            }
            case TYPE::Object: {
                if (val.m_items.empty()) {
                    out << "{}";
                    return;
                }
                out << '{';
                for (size_t i = 0; i < val.m_items.size(); ++i) {
                    if (i) out << ',';
                    newline(level + indent);
                    out << escape_json_string(val.m_items[i].first) << (indent > 0 ? ": " : ":");
                    dumpValue(val.m_items[i].second, level + indent);
                }
                newline(level);
                out << '}';
                return;
            }
        }
    };

    dumpValue(*this, 0);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& os, const Dictionary& d) {
    os << d.dump();
    return os;
}

}  // namespace ig
