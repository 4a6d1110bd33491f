#include "internal/query/field_context.hpp"

#include "internal/util/overloaded.hpp"

namespace sbomgraph::query {

Field ParseField(std::string_view name) {
  if (name == "sbom_id") return Field::kSbomId;
  if (name == "node_id") return Field::kNodeId;
  if (name == "name") return Field::kName;
  if (name == "version") return Field::kVersion;
  if (name == "purl") return Field::kPurl;
  if (name == "cpe") return Field::kCpe;
  if (name == "external_document_reference") return Field::kExternalDocumentReference;
  if (name == "external_node_id") return Field::kExternalNodeId;
  return Field::kUnknown;
}

FieldContext::FieldContext(const model::Node& node) {
  const auto& base = model::Base(node);
  Set(Field::kSbomId, {base.sbom_id});
  Set(Field::kNodeId, {base.node_id});
  Set(Field::kName, {base.name});

  std::visit(util::Overloaded{
                 [this](const model::PackageNode& p) {
                   Set(Field::kVersion, {p.version});

                   std::vector<std::string_view> purls;
                   purls.reserve(p.purl.size());
                   for (const auto& purl : p.purl) purls.emplace_back(purl.ToString());
                   Set(Field::kPurl, std::move(purls));

                   std::vector<std::string_view> cpes;
                   cpes.reserve(p.cpe.size());
                   for (const auto& cpe : p.cpe) cpes.emplace_back(cpe.ToString());
                   Set(Field::kCpe, std::move(cpes));
                 },
                 [this](const model::ExternalNode& e) {
                   Set(Field::kExternalDocumentReference, {e.external_document_reference});
                   Set(Field::kExternalNodeId, {e.external_node_id});
                 },
                 [](const model::UnknownNode&) {},
             },
             node);
}

void FieldContext::Set(Field field, std::vector<std::string_view> values) {
  values_[static_cast<std::size_t>(field)] = std::move(values);
}

const std::vector<std::string_view>* FieldContext::Values(Field field) const {
  if (field == Field::kUnknown) return nullptr;
  const auto& slot = values_[static_cast<std::size_t>(field)];
  return slot ? &*slot : nullptr;
}

} // namespace sbomgraph::query
