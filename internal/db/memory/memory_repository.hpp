#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace sbomgraph::db::memory {

class MemoryTransaction;

/*
  In-process repository used by tests and by deployments without a
  database section in their config.

  Read transactions share the committed snapshot; write transactions
  work on a private copy that replaces it on Commit().
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertSourceDocument(Transaction&, const model::SourceDocumentRecord&) override;
  Result InsertSbom(Transaction&, const model::SbomRecord&) override;
  Result InsertNode(Transaction&, const model::NodeRecord&) override;
  Result InsertPackage(Transaction&, const model::PackageRecord&) override;
  Result InsertPurlRef(Transaction&, const model::PurlRefRecord&) override;
  Result InsertCpeRef(Transaction&, const model::CpeRefRecord&) override;
  Result InsertExternalNode(Transaction&, const model::ExternalNodeRecord&) override;
  Result InsertChecksum(Transaction&, const model::ChecksumRecord&) override;
  Result InsertRelationship(Transaction&, const model::RelationshipRecord&) override;

  std::vector<std::string> ListSbomIds(Transaction&) override;
  std::optional<model::GraphRows> FetchGraphRows(Transaction&, const std::string& sbom_id) override;

  std::vector<std::string> FindSbomsByNodeId(Transaction&, const std::string& node_id) override;
  std::vector<std::string> FindSbomsByName(Transaction&, const std::string& name) override;
  std::vector<std::string> FindSbomsByPurl(Transaction&, const std::string& purl) override;
  std::vector<std::string> FindSbomsByCpe(Transaction&, const std::string& cpe) override;

  std::optional<model::ExternalNodeRecord> FindExternalNode(Transaction&, const std::string& node_id) override;
  std::optional<std::string> FindSbomBySourceSha256(Transaction&, const std::string& sha256) override;
  std::optional<std::string> FindSbomByDocumentId(Transaction&, const std::string& document_id) override;
  std::optional<model::ChecksumRecord> FindChecksumByNode(Transaction&, const std::string& node_id) override;
  std::optional<model::ChecksumRecord> FindChecksumMatch(Transaction&, const std::string& value,
                                                         const std::string& exclude_sbom_id) override;
  std::optional<model::PackageRecord> FindPackageByNode(Transaction&, const std::string& node_id) override;
  std::optional<model::PackageRecord> FindPackageByVersion(Transaction&, const std::string& version,
                                                           const std::string& exclude_sbom_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SourceDocumentRecord> source_documents;
    // ordered so listings are stable
    std::map<std::string, model::SbomRecord> sboms;

    std::vector<model::NodeRecord>         nodes;
    std::vector<model::PackageRecord>      packages;
    std::vector<model::PurlRefRecord>      purls;
    std::vector<model::CpeRefRecord>       cpes;
    std::vector<model::ExternalNodeRecord> external_nodes;
    std::vector<model::ChecksumRecord>     checksums;
    std::vector<model::RelationshipRecord> relationships;
  };

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

}
