#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace sbomgraph::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  // Runs a read, turning libpqxx failures into util::DataAccessError.
  template <typename F>
  static auto Read(F&& f) -> decltype(f());

  // Runs a write, turning libpqxx failures into a Result.
  template <typename F>
  static Result Write(F&& f);
};

} // namespace sbomgraph::db::postgres
