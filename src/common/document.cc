#include "document.h"
#include "stream.h"

#include <algorithm>
#include <cctype>
#include <glog/logging.h>

namespace Statfan {

std::optional<DocumentFormat> ParseDocumentFormat(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "yaml") {
        return DocumentFormat::kYaml;
    }
    if (lowered == "flow") {
        return DocumentFormat::kFlow;
    }
    return std::nullopt;
}

Document NewMapDocument() {
    return Document(YAML::NodeType::Map);
}

std::string EmitDocument(const Document& document, DocumentFormat format) {
    YAML::Emitter out;
    if (format == DocumentFormat::kFlow) {
        out.SetMapFormat(YAML::Flow);
        out.SetSeqFormat(YAML::Flow);
    }
    out << document;
    if (!out.good()) {
        throw CodecError("failed to emit document: " + out.GetLastError());
    }
    return std::string(out.c_str(), out.size());
}

Document ParseDocument(std::string_view text) {
    try {
        return YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw CodecError(std::string("malformed document: ") + e.what());
    }
}

Document GetObject(const Document& parent, std::string_view field) {
    if (!parent.IsMap()) {
        return Document();
    }
    const Document child = parent[std::string(field)];
    if (!child.IsDefined() || child.IsNull()) {
        return Document();
    }
    if (!child.IsMap()) {
        throw CodecError("field [" + std::string(field) + "] must be an object");
    }
    return child;
}

int64_t ScalarAsInt64(const Document& scalar, std::string_view what) {
    if (!scalar.IsScalar()) {
        throw CodecError("field [" + std::string(what) + "] must be a number");
    }
    try {
        return scalar.as<int64_t>();
    } catch (const YAML::Exception&) {
        throw CodecError("field [" + std::string(what) + "] is not a number: " + scalar.Scalar());
    }
}

int64_t GetInt64(const Document& parent, std::string_view field, int64_t default_value) {
    if (!parent.IsMap()) {
        return default_value;
    }
    const Document child = parent[std::string(field)];
    if (!child.IsDefined() || child.IsNull()) {
        return default_value;
    }
    return ScalarAsInt64(child, field);
}

bool GetBool(const Document& parent, std::string_view field, bool default_value) {
    if (!parent.IsMap()) {
        return default_value;
    }
    const Document child = parent[std::string(field)];
    if (!child.IsDefined() || child.IsNull()) {
        return default_value;
    }
    try {
        return child.as<bool>();
    } catch (const YAML::Exception&) {
        throw CodecError("field [" + std::string(field) + "] is not a boolean");
    }
}

namespace {

const char* const kBinaryTag = "tag:yaml.org,2002:binary";

// Length of the UTF-8 sequence starting at `i`, or 0 when it is malformed.
size_t DecodeUtf8(std::string_view bytes, size_t i, uint32_t& code_point) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    size_t length;
    uint32_t min;
    if (lead < 0x80) {
        code_point = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        min = 0x80;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        min = 0x800;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        min = 0x10000;
        code_point = lead & 0x07;
    } else {
        return 0;
    }
    if (i + length > bytes.size()) {
        return 0;
    }
    for (size_t k = 1; k < length; ++k) {
        const auto next = static_cast<unsigned char>(bytes[i + k]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }
    if (code_point < min || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return length;
}

} // namespace

bool IsDocumentText(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint32_t code_point = 0;
        const size_t length = DecodeUtf8(bytes, i, code_point);
        if (length == 0) {
            return false;
        }
        if (code_point < 0x20 && code_point != '\t' && code_point != '\n') {
            return false;
        }
        // DEL, C1 controls, YAML's extra line breaks and the byte order mark.
        if ((code_point >= 0x7F && code_point <= 0x9F) || code_point == 0x2028 || code_point == 0x2029 ||
            code_point == 0xFEFF) {
            return false;
        }
        i += length;
    }
    return true;
}

Document BytesToDocument(std::string_view bytes) {
    if (IsDocumentText(bytes)) {
        return Document(std::string(bytes));
    }
    Document node(YAML::Binary(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size()));
    node.SetTag(kBinaryTag);
    return node;
}

std::string BytesFromDocument(const Document& scalar, std::string_view what) {
    if (!scalar.IsScalar()) {
        throw CodecError("field [" + std::string(what) + "] must be a string");
    }
    if (scalar.Tag() != kBinaryTag) {
        return scalar.Scalar();
    }
    YAML::Binary binary;
    try {
        binary = scalar.as<YAML::Binary>();
    } catch (const YAML::Exception&) {
        throw CodecError("field [" + std::string(what) + "] is not valid base64");
    }
    if (binary.size() == 0) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(binary.data()), binary.size());
}

std::optional<std::string> GetOptionalString(const Document& parent, std::string_view field) {
    if (!parent.IsMap()) {
        return std::nullopt;
    }
    const Document child = parent[std::string(field)];
    if (!child.IsDefined() || child.IsNull()) {
        return std::nullopt;
    }
    if (!child.IsScalar()) {
        VLOG(1) << "Field [" << field << "] is not a scalar";
        throw CodecError("field [" + std::string(field) + "] must be a string");
    }
    return child.Scalar();
}

} // namespace Statfan
