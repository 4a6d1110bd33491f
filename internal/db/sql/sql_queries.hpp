#pragma once

#include <string>
#include <vector>

namespace sbomgraph::db::sql {

/*
  Canonical schema used by the relational backends.

  IMPORTANT:
  Written in the SQL subset SQLite and Postgres share, so the same
  statements bootstrap both. Relationship endpoints deliberately carry
  no foreign key: ingestion of degenerate documents may leave dangling
  ones and the graph builder skips them.
*/

inline const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS source_document ("
      " id TEXT PRIMARY KEY,"
      " sha256 TEXT NOT NULL DEFAULT '',"
      " sha384 TEXT NOT NULL DEFAULT '',"
      " sha512 TEXT NOT NULL DEFAULT '');",

      "CREATE TABLE IF NOT EXISTS sbom ("
      " sbom_id TEXT PRIMARY KEY,"
      " document_id TEXT NOT NULL DEFAULT '',"
      " published TEXT NOT NULL DEFAULT '',"
      " source_document_id TEXT REFERENCES source_document(id));",

      "CREATE INDEX IF NOT EXISTS sbom_document_id_idx ON sbom(document_id);",

      "CREATE TABLE IF NOT EXISTS sbom_node ("
      " sbom_id TEXT NOT NULL REFERENCES sbom(sbom_id) ON DELETE CASCADE,"
      " node_id TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " PRIMARY KEY (sbom_id, node_id));",

      "CREATE INDEX IF NOT EXISTS sbom_node_node_id_idx ON sbom_node(node_id);",
      "CREATE INDEX IF NOT EXISTS sbom_node_name_idx ON sbom_node(name);",

      "CREATE TABLE IF NOT EXISTS sbom_package ("
      " sbom_id TEXT NOT NULL,"
      " node_id TEXT NOT NULL,"
      " version TEXT NOT NULL DEFAULT '',"
      " PRIMARY KEY (sbom_id, node_id),"
      " FOREIGN KEY (sbom_id, node_id) REFERENCES sbom_node(sbom_id, node_id) ON DELETE CASCADE);",

      "CREATE INDEX IF NOT EXISTS sbom_package_node_id_idx ON sbom_package(node_id);",
      "CREATE INDEX IF NOT EXISTS sbom_package_version_idx ON sbom_package(version);",

      "CREATE TABLE IF NOT EXISTS sbom_package_purl ("
      " sbom_id TEXT NOT NULL,"
      " node_id TEXT NOT NULL,"
      " purl TEXT NOT NULL,"
      " FOREIGN KEY (sbom_id, node_id) REFERENCES sbom_node(sbom_id, node_id) ON DELETE CASCADE);",

      "CREATE INDEX IF NOT EXISTS sbom_package_purl_purl_idx ON sbom_package_purl(purl);",
      "CREATE INDEX IF NOT EXISTS sbom_package_purl_sbom_idx ON sbom_package_purl(sbom_id);",

      "CREATE TABLE IF NOT EXISTS sbom_package_cpe ("
      " sbom_id TEXT NOT NULL,"
      " node_id TEXT NOT NULL,"
      " cpe TEXT NOT NULL,"
      " FOREIGN KEY (sbom_id, node_id) REFERENCES sbom_node(sbom_id, node_id) ON DELETE CASCADE);",

      "CREATE INDEX IF NOT EXISTS sbom_package_cpe_cpe_idx ON sbom_package_cpe(cpe);",
      "CREATE INDEX IF NOT EXISTS sbom_package_cpe_sbom_idx ON sbom_package_cpe(sbom_id);",

      "CREATE TABLE IF NOT EXISTS sbom_external_node ("
      " sbom_id TEXT NOT NULL,"
      " node_id TEXT NOT NULL,"
      " external_doc_ref TEXT NOT NULL,"
      " external_node_ref TEXT NOT NULL,"
      " external_type INTEGER NOT NULL,"
      " discriminator_type INTEGER,"
      " discriminator_value TEXT,"
      " PRIMARY KEY (sbom_id, node_id),"
      " FOREIGN KEY (sbom_id, node_id) REFERENCES sbom_node(sbom_id, node_id) ON DELETE CASCADE);",

      "CREATE INDEX IF NOT EXISTS sbom_external_node_node_id_idx ON sbom_external_node(node_id);",

      "CREATE TABLE IF NOT EXISTS sbom_node_checksum ("
      " sbom_id TEXT NOT NULL,"
      " node_id TEXT NOT NULL,"
      " type TEXT NOT NULL,"
      " value TEXT NOT NULL,"
      " FOREIGN KEY (sbom_id, node_id) REFERENCES sbom_node(sbom_id, node_id) ON DELETE CASCADE);",

      "CREATE INDEX IF NOT EXISTS sbom_node_checksum_node_id_idx ON sbom_node_checksum(node_id);",
      "CREATE INDEX IF NOT EXISTS sbom_node_checksum_value_idx ON sbom_node_checksum(value);",

      "CREATE TABLE IF NOT EXISTS package_relates_to_package ("
      " sbom_id TEXT NOT NULL REFERENCES sbom(sbom_id) ON DELETE CASCADE,"
      " left_node_id TEXT NOT NULL,"
      " relationship TEXT NOT NULL,"
      " right_node_id TEXT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS package_relates_to_package_sbom_idx ON package_relates_to_package(sbom_id);",
  };
  return kSchema;
}

// ------------------------------------------------------------------
// Reads (SQLite placeholders; the Postgres backend numbers them)
// ------------------------------------------------------------------

static constexpr const char* SELECT_SBOM_IDS = "SELECT sbom_id FROM sbom ORDER BY sbom_id;";

static constexpr const char* SELECT_SBOM =
    "SELECT sbom_id,document_id,published,COALESCE(source_document_id,'')"
    " FROM sbom WHERE sbom_id=?;";

static constexpr const char* SELECT_GRAPH_NODES =
    "SELECT n.node_id, n.name,"
    " p.node_id IS NOT NULL, COALESCE(p.version,''),"
    " e.node_id IS NOT NULL, COALESCE(e.external_doc_ref,''), COALESCE(e.external_node_ref,'')"
    " FROM sbom_node n"
    " LEFT JOIN sbom_package p ON p.sbom_id=n.sbom_id AND p.node_id=n.node_id"
    " LEFT JOIN sbom_external_node e ON e.sbom_id=n.sbom_id AND e.node_id=n.node_id"
    " WHERE n.sbom_id=? ORDER BY n.node_id;";

static constexpr const char* SELECT_GRAPH_PURLS = "SELECT node_id,purl FROM sbom_package_purl WHERE sbom_id=?;";

static constexpr const char* SELECT_GRAPH_CPES = "SELECT node_id,cpe FROM sbom_package_cpe WHERE sbom_id=?;";

static constexpr const char* SELECT_GRAPH_RELATIONSHIPS =
    "SELECT sbom_id,left_node_id,relationship,right_node_id"
    " FROM package_relates_to_package WHERE sbom_id=?;";

static constexpr const char* SELECT_SBOMS_BY_NODE_ID = "SELECT DISTINCT sbom_id FROM sbom_node WHERE node_id=? ORDER BY sbom_id;";

static constexpr const char* SELECT_SBOMS_BY_NAME = "SELECT DISTINCT sbom_id FROM sbom_node WHERE name=? ORDER BY sbom_id;";

static constexpr const char* SELECT_SBOMS_BY_PURL = "SELECT DISTINCT sbom_id FROM sbom_package_purl WHERE purl=? ORDER BY sbom_id;";

static constexpr const char* SELECT_SBOMS_BY_CPE = "SELECT DISTINCT sbom_id FROM sbom_package_cpe WHERE cpe=? ORDER BY sbom_id;";

static constexpr const char* SELECT_EXTERNAL_NODE =
    "SELECT sbom_id,node_id,external_doc_ref,external_node_ref,external_type,discriminator_type,discriminator_value"
    " FROM sbom_external_node WHERE node_id=? LIMIT 1;";

static constexpr const char* SELECT_SBOM_BY_SOURCE_SHA256 =
    "SELECT s.sbom_id FROM sbom s JOIN source_document d ON d.id=s.source_document_id"
    " WHERE d.sha256=? LIMIT 1;";

static constexpr const char* SELECT_SBOM_BY_DOCUMENT_ID = "SELECT sbom_id FROM sbom WHERE document_id=? LIMIT 1;";

static constexpr const char* SELECT_CHECKSUM_BY_NODE =
    "SELECT sbom_id,node_id,type,value FROM sbom_node_checksum WHERE node_id=? LIMIT 1;";

static constexpr const char* SELECT_CHECKSUM_MATCH =
    "SELECT sbom_id,node_id,type,value FROM sbom_node_checksum WHERE value=? AND sbom_id<>? LIMIT 1;";

static constexpr const char* SELECT_PACKAGE_BY_NODE = "SELECT sbom_id,node_id,version FROM sbom_package WHERE node_id=? LIMIT 1;";

static constexpr const char* SELECT_PACKAGE_BY_VERSION =
    "SELECT sbom_id,node_id,version FROM sbom_package WHERE version=? AND sbom_id<>? LIMIT 1;";

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

static constexpr const char* INSERT_SOURCE_DOCUMENT = "INSERT INTO source_document(id,sha256,sha384,sha512) VALUES(?,?,?,?);";

static constexpr const char* INSERT_SBOM =
    "INSERT INTO sbom(sbom_id,document_id,published,source_document_id) VALUES(?,?,?,NULLIF(?,''));";

static constexpr const char* INSERT_NODE = "INSERT INTO sbom_node(sbom_id,node_id,name) VALUES(?,?,?);";

static constexpr const char* INSERT_PACKAGE = "INSERT INTO sbom_package(sbom_id,node_id,version) VALUES(?,?,?);";

static constexpr const char* INSERT_PURL_REF = "INSERT INTO sbom_package_purl(sbom_id,node_id,purl) VALUES(?,?,?);";

static constexpr const char* INSERT_CPE_REF = "INSERT INTO sbom_package_cpe(sbom_id,node_id,cpe) VALUES(?,?,?);";

static constexpr const char* INSERT_EXTERNAL_NODE =
    "INSERT INTO sbom_external_node(sbom_id,node_id,external_doc_ref,external_node_ref,external_type,discriminator_type,discriminator_value)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* INSERT_CHECKSUM = "INSERT INTO sbom_node_checksum(sbom_id,node_id,type,value) VALUES(?,?,?,?);";

static constexpr const char* INSERT_RELATIONSHIP =
    "INSERT INTO package_relates_to_package(sbom_id,left_node_id,relationship,right_node_id) VALUES(?,?,?,?);";

// Rewrites '?' placeholders as $1, $2, ... for libpq.
std::string NumberPlaceholders(const char* sql);

} // namespace sbomgraph::db::sql
