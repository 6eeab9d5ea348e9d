#include <toolserve/mcp/schema_builder.hpp>

namespace toolserve {

SchemaBuilder::SchemaBuilder()
    : properties_(nlohmann::json::object()),
      required_(nlohmann::json::array()) {}

SchemaBuilder SchemaBuilder::Object() {
    return SchemaBuilder();
}

SchemaBuilder& SchemaBuilder::StringProperty(const std::string& name,
                                             const std::string& description,
                                             bool required) {
    return AddProperty(name, {{"type", "string"}, {"description", description}},
                       required);
}

SchemaBuilder& SchemaBuilder::AddProperty(const std::string& name,
                                          nlohmann::json property,
                                          bool required) {
    properties_[name] = std::move(property);
    if (required) {
        required_.push_back(name);
    }
    return *this;
}

nlohmann::json SchemaBuilder::ToJson() const {
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", properties_},
    };
    if (!required_.empty()) {
        schema["required"] = required_;
    }
    return schema;
}

std::string SchemaBuilder::Build() const {
    return ToJson().dump();
}

} // namespace toolserve
