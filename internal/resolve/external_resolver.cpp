#include "internal/resolve/external_resolver.hpp"

#include "internal/observability/logging.hpp"

namespace sbomgraph::resolve {

namespace {

using db::model::DiscriminatorType;
using db::model::ExternalNodeRecord;
using db::model::ExternalType;

bool HasDiscriminatorValue(const ExternalNodeRecord& ext) {
  return ext.discriminator_value && !ext.discriminator_value->empty();
}

std::optional<model::ResolvedSbom> ResolveSpdx(db::Repository& repo, db::Transaction& tx,
                                               const ExternalNodeRecord& ext) {
  if (!HasDiscriminatorValue(ext)) return std::nullopt;
  if (ext.discriminator_type != DiscriminatorType::kSha256) return std::nullopt;

  auto sbom_id = repo.FindSbomBySourceSha256(tx, *ext.discriminator_value);
  if (!sbom_id) return std::nullopt;

  return model::ResolvedSbom{std::move(*sbom_id), ext.external_node_ref};
}

std::optional<model::ResolvedSbom> ResolveCycloneDx(db::Repository& repo, db::Transaction& tx,
                                                    const ExternalNodeRecord& ext) {
  if (!HasDiscriminatorValue(ext)) return std::nullopt;

  const auto document_id = "urn:cdx:" + ext.external_doc_ref + "/" + *ext.discriminator_value;

  auto sbom_id = repo.FindSbomByDocumentId(tx, document_id);
  if (!sbom_id) return std::nullopt;

  return model::ResolvedSbom{std::move(*sbom_id), ext.external_node_ref};
}

std::optional<model::ResolvedSbom> ResolveProductComponent(db::Repository& repo, db::Transaction& tx,
                                                           const ExternalNodeRecord& ext) {
  if (auto checksum = repo.FindChecksumByNode(tx, ext.external_node_ref)) {
    auto matched = repo.FindChecksumMatch(tx, checksum->value, checksum->sbom_id);
    if (!matched) return std::nullopt;
    return model::ResolvedSbom{std::move(matched->sbom_id), std::move(matched->node_id)};
  }

  auto variant = repo.FindPackageByNode(tx, ext.external_node_ref);
  if (!variant) return std::nullopt;

  auto matched = repo.FindPackageByVersion(tx, variant->version, variant->sbom_id);
  if (!matched) return std::nullopt;
  return model::ResolvedSbom{std::move(matched->sbom_id), std::move(matched->node_id)};
}

} // namespace

std::optional<model::ResolvedSbom> ResolveExternalSbom(db::Repository& repo, db::Transaction& tx,
                                                       const std::string& node_id) {
  auto ext = repo.FindExternalNode(tx, node_id);
  if (!ext) return std::nullopt;

  std::optional<model::ResolvedSbom> resolved;
  switch (ext->external_type) {
    case ExternalType::kSpdx:
      resolved = ResolveSpdx(repo, tx, *ext);
      break;
    case ExternalType::kCycloneDx:
      resolved = ResolveCycloneDx(repo, tx, *ext);
      break;
    case ExternalType::kProductComponent:
      resolved = ResolveProductComponent(repo, tx, *ext);
      break;
  }

  if (!resolved) {
    SBOMGRAPH_LOG_DEBUG("external reference not resolved",
                        {observability::StringField("node_id", node_id),
                         observability::StringField("external_doc_ref", ext->external_doc_ref)});
  }
  return resolved;
}

} // namespace sbomgraph::resolve
