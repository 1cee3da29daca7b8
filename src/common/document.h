#ifndef STATFAN_COMMON_DOCUMENT_H_
#define STATFAN_COMMON_DOCUMENT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace Statfan {

// Hierarchical document form: an insertion-ordered tree of maps, sequences
// and scalars.
using Document = YAML::Node;

enum class DocumentFormat {
    kYaml,  // block style, one field per line
    kFlow   // single line, braces and brackets
};

std::optional<DocumentFormat> ParseDocumentFormat(std::string_view name);

Document NewMapDocument();

std::string EmitDocument(const Document& document, DocumentFormat format = DocumentFormat::kYaml);

// Throws CodecError when the text is not a well-formed document.
Document ParseDocument(std::string_view text);

/**
 * Field accessors used by the FromDocument decoders. A missing field yields
 * the default; a field that is present but of the wrong shape throws
 * CodecError. Unknown fields are never looked at.
 */
// Returns the child object, or a null document when the field is absent.
Document GetObject(const Document& parent, std::string_view field);
int64_t GetInt64(const Document& parent, std::string_view field, int64_t default_value = 0);
bool GetBool(const Document& parent, std::string_view field, bool default_value = false);
std::optional<std::string> GetOptionalString(const Document& parent, std::string_view field);

int64_t ScalarAsInt64(const Document& scalar, std::string_view what);

// Printable UTF-8 (tab and newline allowed) that survives a document round trip as a string.
bool IsDocumentText(std::string_view bytes);

// Opaque bytes as a string scalar when they are document text, otherwise as a
// base64 scalar tagged !!binary.
Document BytesToDocument(std::string_view bytes);

// Inverse of BytesToDocument. Untagged scalars are taken as text.
std::string BytesFromDocument(const Document& scalar, std::string_view what);

} // namespace Statfan

#endif // STATFAN_COMMON_DOCUMENT_H_
