#include <ig/schema.h>

namespace ig {

SchemaNode SchemaNode::tagged(std::string text) {
    SchemaNode node;
    node.shape_ = Shape::Tagged;
    node.tag_ = Tag::parse(text);
    node.text_ = std::move(text);
    return node;
}

SchemaNode SchemaNode::mapping(Fields fields) {
    SchemaNode node;
    node.shape_ = Shape::Mapping;
    node.fields_ = std::move(fields);
    return node;
}

SchemaNode SchemaNode::listOf(SchemaNode element) {
    SchemaNode node;
    node.shape_ = Shape::ListTemplate;
    node.element_.push_back(std::move(element));
    return node;
}

SchemaNode SchemaNode::unsupported(Dictionary raw) {
    SchemaNode node;
    node.shape_ = Shape::Unsupported;
    node.raw_ = std::move(raw);
    return node;
}

SchemaNode SchemaNode::fromDictionary(const Dictionary& raw) {
    switch (raw.type()) {
        case Dictionary::String:
            return tagged(raw.asString());
        case Dictionary::Object: {
            Fields fields;
            fields.reserve(static_cast<size_t>(raw.size()));
            for (auto const& p : raw.items()) fields.emplace_back(p.first, fromDictionary(p.second));
            return mapping(std::move(fields));
        }
        case Dictionary::Array: {
            // Only the first element is the template. An empty template or
            // one that is neither a string nor an object cannot be checked.
            if (raw.empty()) return unsupported(raw);
            const Dictionary& first = raw.at(0);
            if (!first.isString() && !first.isMappedObject()) return unsupported(raw);
            SchemaNode node = listOf(fromDictionary(first));
            node.raw_ = raw;
            return node;
        }
        case Dictionary::Integer:
        case Dictionary::Double:
        case Dictionary::Boolean:
        case Dictionary::Null:
            return unsupported(raw);
    }
    return unsupported(raw);
}

const SchemaNode* SchemaNode::find(const std::string& key) const {
    for (auto const& f : fields_) {
        if (f.first == key) return &f.second;
    }
    return nullptr;
}

Dictionary SchemaNode::describe() const {
    switch (shape_) {
        case Shape::Tagged:
            return Dictionary(text_);
        case Shape::Mapping: {
            Dictionary out;
            for (auto const& f : fields_) out[f.first] = f.second.describe();
            return out;
        }
        case Shape::ListTemplate:
            // templates with more than one entry are reported as written
            if (!raw_.empty()) return raw_;
            return Dictionary(std::vector<Dictionary>{element_.front().describe()});
        case Shape::Unsupported:
            return raw_;
    }
    return raw_;
}

}  // namespace ig
