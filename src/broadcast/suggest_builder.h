#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../common/document.h"

namespace Statfan {

/**
 * One named suggestion of a suggest query, e.g.
 *   my-suggestion: { text: "serch", term: { field: body, size: 3 } }
 */
class SuggestionBuilder {
public:
    enum class Type { kTerm, kPhrase, kCompletion };

    SuggestionBuilder(std::string name, Type type) : name_(std::move(name)), type_(type) {}

    SuggestionBuilder& Text(std::string text) { text_ = std::move(text); return *this; }
    SuggestionBuilder& Field(std::string field) { field_ = std::move(field); return *this; }
    SuggestionBuilder& Analyzer(std::string analyzer) { analyzer_ = std::move(analyzer); return *this; }
    SuggestionBuilder& Size(int size) { size_ = size; return *this; }

    const std::string& name() const { return name_; }

    // Adds "<name>: {...}" to |out|.
    void ToDocument(Document& out) const;

    // Standalone query holding just this suggestion.
    std::string BuildAsBytes(DocumentFormat format = DocumentFormat::kFlow) const;

private:
    std::string name_;
    Type type_;
    std::optional<std::string> text_;
    std::optional<std::string> field_;
    std::optional<std::string> analyzer_;
    std::optional<int> size_;
};

const char* SuggestionTypeName(SuggestionBuilder::Type type);

/**
 * Structured suggest query: an optional global text shared by all
 * suggestions, followed by the suggestions in insertion order.
 */
class SuggestBuilder {
public:
    SuggestBuilder& SetText(std::string text) { global_text_ = std::move(text); return *this; }
    SuggestBuilder& AddSuggestion(SuggestionBuilder suggestion) {
        suggestions_.push_back(std::move(suggestion));
        return *this;
    }

    Document ToDocument() const;
    std::string BuildAsBytes(DocumentFormat format = DocumentFormat::kFlow) const;

private:
    std::optional<std::string> global_text_;
    std::vector<SuggestionBuilder> suggestions_;
};

} // namespace Statfan
