#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace toolserve {

// ---------------------------------------------------------------------------
// SchemaBuilder: fluent builder for the JSON Schema text returned by
// ITool::InputSchema().
//
//   SchemaBuilder::Object()
//       .StringProperty("checkId", "Check ID", true)
//       .Build();
// ---------------------------------------------------------------------------
class SchemaBuilder {
public:
    static SchemaBuilder Object();

    SchemaBuilder& StringProperty(const std::string& name,
                                  const std::string& description,
                                  bool required = false);

    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] std::string Build() const;

private:
    SchemaBuilder();

    SchemaBuilder& AddProperty(const std::string& name, nlohmann::json property,
                               bool required);

    nlohmann::json properties_;
    nlohmann::json required_;
};

} // namespace toolserve
