#include <ig/classify.h>

namespace ig {

ValidationKind classify(const Tag& tag) noexcept {
    switch (tag.modifier) {
        case TagModifier::Auto:
            return ValidationKind::Auto;
        case TagModifier::Optional:
            return ValidationKind::Optional;
        case TagModifier::None:
            break;
    }
    switch (tag.base) {
        case TagBase::List:
            return ValidationKind::RequiredStringList;
        case TagBase::Any:
            return ValidationKind::RequiredAny;
        case TagBase::Numeric:
            return ValidationKind::RequiredNumeric;
        case TagBase::Text:
            return ValidationKind::RequiredString;
    }
    return ValidationKind::RequiredString;
}

ValidationKind classify(const SchemaNode& node) noexcept {
    switch (node.shape()) {
        case SchemaNode::Shape::Tagged:
            return classify(node.tag());
        case SchemaNode::Shape::Mapping:
            return ValidationKind::RequiredObject;
        case SchemaNode::Shape::ListTemplate: {
            const SchemaNode* element = node.element();
            if (element == nullptr) return ValidationKind::Auto;
            if (element->isTagged()) {
                // a skippable element makes the whole list skippable
                if (element->tag().skippable()) return ValidationKind::Optional;
                return ValidationKind::RequiredStringList;
            }
            if (element->isMapping()) return ValidationKind::RequiredDictList;
            return ValidationKind::Auto;
        }
        case SchemaNode::Shape::Unsupported:
            return ValidationKind::Auto;
    }
    return ValidationKind::Auto;
}

const char* to_string(ValidationKind kind) noexcept {
    switch (kind) {
        case ValidationKind::Auto:
            return "Auto";
        case ValidationKind::Optional:
            return "Optional";
        case ValidationKind::RequiredString:
            return "RequiredString";
        case ValidationKind::RequiredAny:
            return "RequiredAny";
        case ValidationKind::RequiredNumeric:
            return "RequiredNumeric";
        case ValidationKind::RequiredObject:
            return "RequiredObject";
        case ValidationKind::RequiredStringList:
            return "RequiredStringList";
        case ValidationKind::RequiredDictList:
            return "RequiredDictList";
    }
    return "Unknown";
}

}  // namespace ig
