#include "json/field_name_encoder.hpp"

#include "json/json_text.hpp"

namespace jemit::json {

namespace {

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

auto is_identifier_part(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

} // namespace

void QuotedFieldNameEncoder::encode(std::string_view name, OutputSink& out) const {
    out.write(quote_string(name));
}

auto IdentifierFieldNameEncoder::is_identifier(std::string_view name) -> bool {
    if (name.empty() || !is_identifier_start(name.front())) {
        return false;
    }
    for (char c : name.substr(1)) {
        if (!is_identifier_part(c)) {
            return false;
        }
    }
    return true;
}

void IdentifierFieldNameEncoder::encode(std::string_view name, OutputSink& out) const {
    if (is_identifier(name)) {
        out.write(name);
    } else {
        out.write(quote_string(name));
    }
}

} // namespace jemit::json
