#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sbomgraph::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  // path of the database file; every transaction opens its own connection
  explicit SqliteRepository(std::string path);

  // Creates the tables and indexes if they do not exist.
  void BootstrapSchema();

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
  std::string path_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace sbomgraph::db::sqlite
