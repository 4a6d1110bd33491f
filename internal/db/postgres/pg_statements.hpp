#pragma once

#include <utility>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"

namespace sbomgraph::db::postgres {

// Prepared statement names used by PgRepository.
inline constexpr const char* kSelectSbomIds            = "select_sbom_ids";
inline constexpr const char* kSelectSbom               = "select_sbom";
inline constexpr const char* kSelectGraphNodes         = "select_graph_nodes";
inline constexpr const char* kSelectGraphPurls         = "select_graph_purls";
inline constexpr const char* kSelectGraphCpes          = "select_graph_cpes";
inline constexpr const char* kSelectGraphRelationships = "select_graph_relationships";
inline constexpr const char* kSelectSbomsByNodeId      = "select_sboms_by_node_id";
inline constexpr const char* kSelectSbomsByName        = "select_sboms_by_name";
inline constexpr const char* kSelectSbomsByPurl        = "select_sboms_by_purl";
inline constexpr const char* kSelectSbomsByCpe         = "select_sboms_by_cpe";
inline constexpr const char* kSelectExternalNode       = "select_external_node";
inline constexpr const char* kSelectSbomBySourceSha256 = "select_sbom_by_source_sha256";
inline constexpr const char* kSelectSbomByDocumentId   = "select_sbom_by_document_id";
inline constexpr const char* kSelectChecksumByNode     = "select_checksum_by_node";
inline constexpr const char* kSelectChecksumMatch      = "select_checksum_match";
inline constexpr const char* kSelectPackageByNode      = "select_package_by_node";
inline constexpr const char* kSelectPackageByVersion   = "select_package_by_version";
inline constexpr const char* kInsertSourceDocument     = "insert_source_document";
inline constexpr const char* kInsertSbom               = "insert_sbom";
inline constexpr const char* kInsertNode               = "insert_node";
inline constexpr const char* kInsertPackage            = "insert_package";
inline constexpr const char* kInsertPurlRef            = "insert_purl_ref";
inline constexpr const char* kInsertCpeRef             = "insert_cpe_ref";
inline constexpr const char* kInsertExternalNode       = "insert_external_node";
inline constexpr const char* kInsertChecksum           = "insert_checksum";
inline constexpr const char* kInsertRelationship       = "insert_relationship";

inline const std::vector<std::pair<const char*, const char*>>& Statements() {
  static const std::vector<std::pair<const char*, const char*>> kStatements = {
      {kSelectSbomIds, sql::SELECT_SBOM_IDS},
      {kSelectSbom, sql::SELECT_SBOM},
      {kSelectGraphNodes, sql::SELECT_GRAPH_NODES},
      {kSelectGraphPurls, sql::SELECT_GRAPH_PURLS},
      {kSelectGraphCpes, sql::SELECT_GRAPH_CPES},
      {kSelectGraphRelationships, sql::SELECT_GRAPH_RELATIONSHIPS},
      {kSelectSbomsByNodeId, sql::SELECT_SBOMS_BY_NODE_ID},
      {kSelectSbomsByName, sql::SELECT_SBOMS_BY_NAME},
      {kSelectSbomsByPurl, sql::SELECT_SBOMS_BY_PURL},
      {kSelectSbomsByCpe, sql::SELECT_SBOMS_BY_CPE},
      {kSelectExternalNode, sql::SELECT_EXTERNAL_NODE},
      {kSelectSbomBySourceSha256, sql::SELECT_SBOM_BY_SOURCE_SHA256},
      {kSelectSbomByDocumentId, sql::SELECT_SBOM_BY_DOCUMENT_ID},
      {kSelectChecksumByNode, sql::SELECT_CHECKSUM_BY_NODE},
      {kSelectChecksumMatch, sql::SELECT_CHECKSUM_MATCH},
      {kSelectPackageByNode, sql::SELECT_PACKAGE_BY_NODE},
      {kSelectPackageByVersion, sql::SELECT_PACKAGE_BY_VERSION},
      {kInsertSourceDocument, sql::INSERT_SOURCE_DOCUMENT},
      {kInsertSbom, sql::INSERT_SBOM},
      {kInsertNode, sql::INSERT_NODE},
      {kInsertPackage, sql::INSERT_PACKAGE},
      {kInsertPurlRef, sql::INSERT_PURL_REF},
      {kInsertCpeRef, sql::INSERT_CPE_REF},
      {kInsertExternalNode, sql::INSERT_EXTERNAL_NODE},
      {kInsertChecksum, sql::INSERT_CHECKSUM},
      {kInsertRelationship, sql::INSERT_RELATIONSHIP},
  };
  return kStatements;
}

} // namespace sbomgraph::db::postgres
