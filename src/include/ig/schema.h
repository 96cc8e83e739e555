#pragma once

#include <ig/dictionary.h>
#include <ig/tag.h>
#include <string>
#include <utility>
#include <vector>

namespace ig {

// One node of an item schema, built once from the raw schema document.
//
//   "[int or float] score"        -> Tagged
//   {"name": ..., "email": ...}   -> Mapping (a required sub-object)
//   [ <node> ]                    -> ListTemplate (shape of every element)
//   anything else                 -> Unsupported (never validated)
class SchemaNode {
  public:
    enum class Shape { Tagged, Mapping, ListTemplate, Unsupported };

    using Field = std::pair<std::string, SchemaNode>;
    using Fields = std::vector<Field>;

    SchemaNode() = default;

    static SchemaNode tagged(std::string text);
    static SchemaNode mapping(Fields fields);
    static SchemaNode listOf(SchemaNode element);
    static SchemaNode unsupported(Dictionary raw);

    // Build the node tree for a raw schema value. Never throws: shapes the
    // schema format does not know become Unsupported nodes.
    static SchemaNode fromDictionary(const Dictionary& raw);

    Shape shape() const noexcept { return shape_; }
    bool isTagged() const noexcept { return shape_ == Shape::Tagged; }
    bool isMapping() const noexcept { return shape_ == Shape::Mapping; }
    bool isListTemplate() const noexcept { return shape_ == Shape::ListTemplate; }

    // Tagged only
    const std::string& text() const { return text_; }
    const Tag& tag() const { return tag_; }

    // Mapping only; empty for other shapes
    const Fields& fields() const noexcept { return fields_; }
    const SchemaNode* find(const std::string& key) const;

    // ListTemplate only; nullptr for an empty template
    const SchemaNode* element() const noexcept { return element_.empty() ? nullptr : &element_.front(); }

    // The schema value this node was built from, as reported in violations.
    Dictionary describe() const;

  private:
    Shape shape_ = Shape::Unsupported;
    std::string text_;
    Tag tag_;
    Fields fields_;
    std::vector<SchemaNode> element_;
    Dictionary raw_;
};

}  // namespace ig
