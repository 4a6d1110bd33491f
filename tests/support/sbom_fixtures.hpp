#pragma once

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace sbomgraph::test {

/*
  Ingests SBOM rows into any repository inside one write transaction.

  Every insert is asserted; Commit() must be called once at the end.
*/
class SbomWriter {
 public:
  explicit SbomWriter(db::Repository& repo) : repo_(repo), tx_(repo.Begin()) {
  }

  SbomWriter& Sbom(const std::string& sbom_id, const std::string& document_id, const std::string& source_sha256 = "") {
    db::model::SbomRecord sbom;
    sbom.sbom_id     = sbom_id;
    sbom.document_id = document_id;
    sbom.published   = "2024-01-01T00:00:00Z";

    if (!source_sha256.empty()) {
      db::model::SourceDocumentRecord doc;
      doc.id     = "src-" + sbom_id;
      doc.sha256 = source_sha256;
      Check(repo_.InsertSourceDocument(*tx_, doc));
      sbom.source_document_id = doc.id;
    }

    Check(repo_.InsertSbom(*tx_, sbom));
    return *this;
  }

  SbomWriter& Package(const std::string& sbom_id, const std::string& node_id, const std::string& name,
                      const std::string& version, const std::vector<std::string>& purls = {},
                      const std::vector<std::string>& cpes = {}) {
    Node(sbom_id, node_id, name);
    Check(repo_.InsertPackage(*tx_, db::model::PackageRecord{sbom_id, node_id, version}));
    for (const auto& purl : purls) {
      Check(repo_.InsertPurlRef(*tx_, db::model::PurlRefRecord{sbom_id, node_id, purl}));
    }
    for (const auto& cpe : cpes) {
      Check(repo_.InsertCpeRef(*tx_, db::model::CpeRefRecord{sbom_id, node_id, cpe}));
    }
    return *this;
  }

  SbomWriter& Node(const std::string& sbom_id, const std::string& node_id, const std::string& name) {
    Check(repo_.InsertNode(*tx_, db::model::NodeRecord{sbom_id, node_id, name}));
    return *this;
  }

  SbomWriter& External(const std::string& sbom_id, const std::string& node_id, db::model::ExternalType type,
                       const std::string& doc_ref, const std::string& node_ref,
                       std::optional<db::model::DiscriminatorType> discriminator_type = std::nullopt,
                       std::optional<std::string>                  discriminator_value = std::nullopt) {
    Node(sbom_id, node_id, "external " + node_id);

    db::model::ExternalNodeRecord ext;
    ext.sbom_id             = sbom_id;
    ext.node_id             = node_id;
    ext.external_doc_ref    = doc_ref;
    ext.external_node_ref   = node_ref;
    ext.external_type       = type;
    ext.discriminator_type  = discriminator_type;
    ext.discriminator_value = std::move(discriminator_value);
    Check(repo_.InsertExternalNode(*tx_, ext));
    return *this;
  }

  SbomWriter& Checksum(const std::string& sbom_id, const std::string& node_id, const std::string& type,
                       const std::string& value) {
    Check(repo_.InsertChecksum(*tx_, db::model::ChecksumRecord{sbom_id, node_id, type, value}));
    return *this;
  }

  SbomWriter& Relate(const std::string& sbom_id, const std::string& left, const std::string& relationship,
                     const std::string& right) {
    Check(repo_.InsertRelationship(*tx_, db::model::RelationshipRecord{sbom_id, left, relationship, right}));
    return *this;
  }

  void Commit() {
    tx_->Commit();
  }

 private:
  static void Check(const db::Result& result) {
    if (!result) {
      std::cerr << "fixture insert failed: " << db::ToString(result.code) << " " << result.message << "\n";
    }
    assert(result && "fixture insert failed");
  }

  db::Repository&                  repo_;
  std::unique_ptr<db::Transaction> tx_;
};

/*
  Two SBOMs linked by a CycloneDX reference:

    sbom-a:  app --depends_on--> lib --depends_on--> ext-b
    sbom-b:  core --contains--> util

  ext-b stands for sbom-b's "core" (document urn:cdx:serial-b/1).
*/
inline void SeedCycloneDxPair(db::Repository& repo) {
  using db::model::ExternalType;

  SbomWriter w(repo);
  w.Sbom("sbom-a", "urn:cdx:serial-a/1")
      .Package("sbom-a", "app", "app", "1.0.0", {"pkg:npm/app@1.0.0"})
      .Package("sbom-a", "lib", "lib", "2.1.0", {"pkg:npm/lib@2.1.0"})
      .External("sbom-a", "ext-b", ExternalType::kCycloneDx, "serial-b", "core", std::nullopt, std::string("1"))
      .Relate("sbom-a", "app", "depends_on", "lib")
      .Relate("sbom-a", "lib", "depends_on", "ext-b");

  w.Sbom("sbom-b", "urn:cdx:serial-b/1")
      .Package("sbom-b", "core", "core", "3.0.0", {"pkg:maven/org.example/core@3.0.0"})
      .Package("sbom-b", "util", "util", "3.0.1", {"pkg:maven/org.example/util@3.0.1"})
      .Relate("sbom-b", "core", "contains", "util");
  w.Commit();
}

} // namespace sbomgraph::test
