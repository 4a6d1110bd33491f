#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/external_node_record.hpp"
#include "internal/db/model/graph_rows.hpp"
#include "internal/db/model/node_record.hpp"
#include "internal/db/model/relationship_record.hpp"
#include "internal/db/model/sbom_record.hpp"

namespace sbomgraph::db {

/*
  Repository abstraction.

  The relational store is the source of truth for SBOM documents, their
  nodes and relationships. The analysis engine only reads; the write
  half exists for ingestion tooling and tests.

  GUARANTEES:

  - All writes require a Transaction obtained from Begin()
  - BeginRead() transactions never write and may run concurrently
  - Reads never return partially ingested documents
  - Read failures throw util::DataAccessError; a missing row is
    nullopt / empty, never an error
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Ingestion
  // ---------------------------------------------------------------------

  virtual Result InsertSourceDocument(Transaction&, const model::SourceDocumentRecord&) = 0;

  virtual Result InsertSbom(Transaction&, const model::SbomRecord&) = 0;

  virtual Result InsertNode(Transaction&, const model::NodeRecord&) = 0;

  virtual Result InsertPackage(Transaction&, const model::PackageRecord&) = 0;

  virtual Result InsertPurlRef(Transaction&, const model::PurlRefRecord&) = 0;

  virtual Result InsertCpeRef(Transaction&, const model::CpeRefRecord&) = 0;

  virtual Result InsertExternalNode(Transaction&, const model::ExternalNodeRecord&) = 0;

  virtual Result InsertChecksum(Transaction&, const model::ChecksumRecord&) = 0;

  virtual Result InsertRelationship(Transaction&, const model::RelationshipRecord&) = 0;

  // ---------------------------------------------------------------------
  // Graph loading
  // ---------------------------------------------------------------------

  virtual std::vector<std::string> ListSbomIds(Transaction&) = 0;

  // nullopt when the SBOM does not exist
  virtual std::optional<model::GraphRows> FetchGraphRows(Transaction&, const std::string& sbom_id) = 0;

  // ---------------------------------------------------------------------
  // Query scoping: SBOMs that contain a matching node
  // ---------------------------------------------------------------------

  virtual std::vector<std::string> FindSbomsByNodeId(Transaction&, const std::string& node_id) = 0;

  virtual std::vector<std::string> FindSbomsByName(Transaction&, const std::string& name) = 0;

  virtual std::vector<std::string> FindSbomsByPurl(Transaction&, const std::string& purl) = 0;

  virtual std::vector<std::string> FindSbomsByCpe(Transaction&, const std::string& cpe) = 0;

  // ---------------------------------------------------------------------
  // External reference resolution
  // ---------------------------------------------------------------------

  virtual std::optional<model::ExternalNodeRecord> FindExternalNode(Transaction&, const std::string& node_id) = 0;

  virtual std::optional<std::string> FindSbomBySourceSha256(Transaction&, const std::string& sha256) = 0;

  virtual std::optional<std::string> FindSbomByDocumentId(Transaction&, const std::string& document_id) = 0;

  virtual std::optional<model::ChecksumRecord> FindChecksumByNode(Transaction&, const std::string& node_id) = 0;

  // first checksum row with this value that belongs to another SBOM
  virtual std::optional<model::ChecksumRecord> FindChecksumMatch(Transaction&, const std::string& value, const std::string& exclude_sbom_id) = 0;

  virtual std::optional<model::PackageRecord> FindPackageByNode(Transaction&, const std::string& node_id) = 0;

  // first package row with this version that belongs to another SBOM
  virtual std::optional<model::PackageRecord> FindPackageByVersion(Transaction&, const std::string& version, const std::string& exclude_sbom_id) = 0;
};

} // namespace sbomgraph::db
