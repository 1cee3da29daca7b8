#include "suggest_builder.h"

#include <string>

namespace Statfan {

const char* SuggestionTypeName(SuggestionBuilder::Type type) {
    switch (type) {
        case SuggestionBuilder::Type::kTerm: return "term";
        case SuggestionBuilder::Type::kPhrase: return "phrase";
        case SuggestionBuilder::Type::kCompletion: return "completion";
    }
    return "term";
}

void SuggestionBuilder::ToDocument(Document& out) const {
    Document suggestion = NewMapDocument();
    if (text_) {
        suggestion["text"] = *text_;
    }
    Document body = NewMapDocument();
    if (field_) {
        body["field"] = *field_;
    }
    if (analyzer_) {
        body["analyzer"] = *analyzer_;
    }
    if (size_) {
        body["size"] = *size_;
    }
    suggestion[std::string(SuggestionTypeName(type_))] = body;
    out[name_] = suggestion;
}

std::string SuggestionBuilder::BuildAsBytes(DocumentFormat format) const {
    Document document = NewMapDocument();
    ToDocument(document);
    return EmitDocument(document, format);
}

Document SuggestBuilder::ToDocument() const {
    Document document = NewMapDocument();
    if (global_text_) {
        document["text"] = *global_text_;
    }
    for (const auto& suggestion : suggestions_) {
        suggestion.ToDocument(document);
    }
    return document;
}

std::string SuggestBuilder::BuildAsBytes(DocumentFormat format) const {
    return EmitDocument(ToDocument(), format);
}

} // namespace Statfan
