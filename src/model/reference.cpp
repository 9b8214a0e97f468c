#include "model/reference.hpp"

namespace jemit::model {

auto Reference::to_string() const -> std::string {
    return "{id:" + id_string() + ", title:" + title() + "}";
}

void ReferenceSerializer::write(const Reference& value, json::JsonWriter& out) const {
    out.begin_object();
    out.write_complex_property("id");
    value.write_id(out);
    out.write_property("title", value.title());
    out.end_object();
}

void register_reference_types(json::SerializerContext& ctx) {
    ctx.declare<Reference>("Reference");
    ctx.declare<BasicReference<int64_t>, Reference>("BasicReference<int64>");
    ctx.declare<BasicReference<std::string>, Reference>("BasicReference<string>");
    ctx.declare<LongReference, BasicReference<int64_t>>("LongReference");
    ctx.declare<StringReference, BasicReference<std::string>>("StringReference");
}

} // namespace jemit::model
