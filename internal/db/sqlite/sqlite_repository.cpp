#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <unordered_map>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/purl.hpp"
#include "internal/util/errors.hpp"

namespace sbomgraph::db::sqlite {

using sbomgraph::db::ErrorCode;
using sbomgraph::db::Result;

namespace {

// Owns a prepared statement for the duration of one call.
class Statement {
public:
  Statement(SqliteDB& db, const char* sql) : db_(db.Handle()), st_(db.Prepare(sql)) {}
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  // true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise
  bool Next() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::DataAccessError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindNull(sqlite3_stmt* st, int idx) {
  sqlite3_bind_null(st, idx);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::vector<std::string> SelectStrings(SqliteDB& db, const char* sql, const std::string& arg) {
  Statement st(db, sql);
  BindText(st.get(), 1, arg);

  std::vector<std::string> out;
  while (st.Next()) out.push_back(ColText(st.get(), 0));
  return out;
}

std::optional<std::string> SelectString(SqliteDB& db, const char* sql, const std::string& arg) {
  auto rows = SelectStrings(db, sql, arg);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

model::ChecksumRecord ReadChecksum(sqlite3_stmt* st) {
  model::ChecksumRecord r;
  r.sbom_id = ColText(st, 0);
  r.node_id = ColText(st, 1);
  r.type    = ColText(st, 2);
  r.value   = ColText(st, 3);
  return r;
}

model::PackageRecord ReadPackage(sqlite3_stmt* st) {
  model::PackageRecord r;
  r.sbom_id = ColText(st, 0);
  r.node_id = ColText(st, 1);
  r.version = ColText(st, 2);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::string path)
    : path_(std::move(path)) {}

void SqliteRepository::BootstrapSchema() {
  auto db = std::make_shared<SqliteDB>(path_);
  SqliteTransaction tx(db, SqliteTransaction::Mode::kWrite);
  for (const auto& stmt : sql::SchemaStatements()) db->Exec(stmt);
  tx.Commit();
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(std::make_shared<SqliteDB>(path_), SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(std::make_shared<SqliteDB>(path_), SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Ingestion
// ------------------------------------------------------------------

namespace {

// Prepares, binds via `bind`, steps once. Prepare failures become results.
template <typename Bind>
int ExecWrite(sqlite3* db, const char* sql, Bind bind) {
  sqlite3_stmt* st = nullptr;
  int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) return rc;

  bind(st);

  rc = sqlite3_step(st);
  sqlite3_finalize(st);
  return rc;
}

} // namespace

Result SqliteRepository::InsertSourceDocument(Transaction& t, const model::SourceDocumentRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_SOURCE_DOCUMENT, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindText(st, 2, r.sha256);
    BindText(st, 3, r.sha384);
    BindText(st, 4, r.sha512);
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertSbom(Transaction& t, const model::SbomRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_SBOM, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.document_id);
    BindText(st, 3, r.published);
    BindText(st, 4, r.source_document_id);
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertNode(Transaction& t, const model::NodeRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_NODE, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.node_id);
    BindText(st, 3, r.name);
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertPackage(Transaction& t, const model::PackageRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_PACKAGE, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.node_id);
    BindText(st, 3, r.version);
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertPurlRef(Transaction& t, const model::PurlRefRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_PURL_REF, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.node_id);
    BindText(st, 3, ::sbomgraph::model::CanonicalPurl(r.purl));
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertCpeRef(Transaction& t, const model::CpeRefRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_CPE_REF, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.node_id);
    BindText(st, 3, ::sbomgraph::model::CanonicalCpe(r.cpe));
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertExternalNode(Transaction& t, const model::ExternalNodeRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_EXTERNAL_NODE, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.node_id);
    BindText(st, 3, r.external_doc_ref);
    BindText(st, 4, r.external_node_ref);
    BindI32(st, 5, static_cast<int>(r.external_type));
    if (r.discriminator_type) BindI32(st, 6, static_cast<int>(*r.discriminator_type));
    else BindNull(st, 6);
    if (r.discriminator_value) BindText(st, 7, *r.discriminator_value);
    else BindNull(st, 7);
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertChecksum(Transaction& t, const model::ChecksumRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_CHECKSUM, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.node_id);
    BindText(st, 3, r.type);
    BindText(st, 4, r.value);
  });
  return Translate(db, rc);
}

Result SqliteRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto* db = TX(t).Handle();
  const int rc = ExecWrite(db, sql::INSERT_RELATIONSHIP, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.sbom_id);
    BindText(st, 2, r.left_node_id);
    BindText(st, 3, r.relationship);
    BindText(st, 4, r.right_node_id);
  });
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Graph loading
// ------------------------------------------------------------------

std::vector<std::string> SqliteRepository::ListSbomIds(Transaction& t) {
  Statement st(TX(t).DB(), sql::SELECT_SBOM_IDS);
  std::vector<std::string> out;
  while (st.Next()) out.push_back(ColText(st.get(), 0));
  return out;
}

std::optional<model::GraphRows> SqliteRepository::FetchGraphRows(Transaction& t, const std::string& sbom_id) {
  auto& db = TX(t).DB();

  model::GraphRows rows;
  {
    Statement st(db, sql::SELECT_SBOM);
    BindText(st.get(), 1, sbom_id);
    if (!st.Next()) return std::nullopt;
    rows.sbom.sbom_id            = ColText(st.get(), 0);
    rows.sbom.document_id        = ColText(st.get(), 1);
    rows.sbom.published          = ColText(st.get(), 2);
    rows.sbom.source_document_id = ColText(st.get(), 3);
  }

  std::unordered_map<std::string, std::size_t> index;
  {
    Statement st(db, sql::SELECT_GRAPH_NODES);
    BindText(st.get(), 1, sbom_id);
    while (st.Next()) {
      model::GraphNodeRow row;
      row.sbom_id = sbom_id;
      row.node_id = ColText(st.get(), 0);
      row.name    = ColText(st.get(), 1);
      if (ColI32(st.get(), 4)) {
        row.kind              = model::NodeKind::kExternal;
        row.external_doc_ref  = ColText(st.get(), 5);
        row.external_node_ref = ColText(st.get(), 6);
      } else if (ColI32(st.get(), 2)) {
        row.kind    = model::NodeKind::kPackage;
        row.version = ColText(st.get(), 3);
      }
      index.emplace(row.node_id, rows.nodes.size());
      rows.nodes.push_back(std::move(row));
    }
  }

  auto attach = [&](const char* sql, std::vector<std::string> model::GraphNodeRow::*field) {
    Statement st(db, sql);
    BindText(st.get(), 1, sbom_id);
    while (st.Next()) {
      auto it = index.find(ColText(st.get(), 0));
      if (it != index.end()) (rows.nodes[it->second].*field).push_back(ColText(st.get(), 1));
    }
  };
  attach(sql::SELECT_GRAPH_PURLS, &model::GraphNodeRow::purls);
  attach(sql::SELECT_GRAPH_CPES, &model::GraphNodeRow::cpes);

  {
    Statement st(db, sql::SELECT_GRAPH_RELATIONSHIPS);
    BindText(st.get(), 1, sbom_id);
    while (st.Next()) {
      model::RelationshipRecord r;
      r.sbom_id       = ColText(st.get(), 0);
      r.left_node_id  = ColText(st.get(), 1);
      r.relationship  = ColText(st.get(), 2);
      r.right_node_id = ColText(st.get(), 3);
      rows.relationships.push_back(std::move(r));
    }
  }

  return rows;
}

// ------------------------------------------------------------------
// Query scoping
// ------------------------------------------------------------------

std::vector<std::string> SqliteRepository::FindSbomsByNodeId(Transaction& t, const std::string& node_id) {
  return SelectStrings(TX(t).DB(), sql::SELECT_SBOMS_BY_NODE_ID, node_id);
}

std::vector<std::string> SqliteRepository::FindSbomsByName(Transaction& t, const std::string& name) {
  return SelectStrings(TX(t).DB(), sql::SELECT_SBOMS_BY_NAME, name);
}

std::vector<std::string> SqliteRepository::FindSbomsByPurl(Transaction& t, const std::string& purl) {
  return SelectStrings(TX(t).DB(), sql::SELECT_SBOMS_BY_PURL, ::sbomgraph::model::CanonicalPurl(purl));
}

std::vector<std::string> SqliteRepository::FindSbomsByCpe(Transaction& t, const std::string& cpe) {
  return SelectStrings(TX(t).DB(), sql::SELECT_SBOMS_BY_CPE, ::sbomgraph::model::CanonicalCpe(cpe));
}

// ------------------------------------------------------------------
// External reference resolution
// ------------------------------------------------------------------

std::optional<model::ExternalNodeRecord> SqliteRepository::FindExternalNode(Transaction& t, const std::string& node_id) {
  Statement st(TX(t).DB(), sql::SELECT_EXTERNAL_NODE);
  BindText(st.get(), 1, node_id);
  if (!st.Next()) return std::nullopt;

  model::ExternalNodeRecord r;
  r.sbom_id           = ColText(st.get(), 0);
  r.node_id           = ColText(st.get(), 1);
  r.external_doc_ref  = ColText(st.get(), 2);
  r.external_node_ref = ColText(st.get(), 3);
  r.external_type     = static_cast<model::ExternalType>(ColI32(st.get(), 4));
  if (!ColIsNull(st.get(), 5)) r.discriminator_type = static_cast<model::DiscriminatorType>(ColI32(st.get(), 5));
  if (!ColIsNull(st.get(), 6)) r.discriminator_value = ColText(st.get(), 6);
  return r;
}

std::optional<std::string> SqliteRepository::FindSbomBySourceSha256(Transaction& t, const std::string& sha256) {
  return SelectString(TX(t).DB(), sql::SELECT_SBOM_BY_SOURCE_SHA256, sha256);
}

std::optional<std::string> SqliteRepository::FindSbomByDocumentId(Transaction& t, const std::string& document_id) {
  return SelectString(TX(t).DB(), sql::SELECT_SBOM_BY_DOCUMENT_ID, document_id);
}

std::optional<model::ChecksumRecord> SqliteRepository::FindChecksumByNode(Transaction& t, const std::string& node_id) {
  Statement st(TX(t).DB(), sql::SELECT_CHECKSUM_BY_NODE);
  BindText(st.get(), 1, node_id);
  if (!st.Next()) return std::nullopt;
  return ReadChecksum(st.get());
}

std::optional<model::ChecksumRecord> SqliteRepository::FindChecksumMatch(Transaction& t, const std::string& value,
                                                                         const std::string& exclude_sbom_id) {
  Statement st(TX(t).DB(), sql::SELECT_CHECKSUM_MATCH);
  BindText(st.get(), 1, value);
  BindText(st.get(), 2, exclude_sbom_id);
  if (!st.Next()) return std::nullopt;
  return ReadChecksum(st.get());
}

std::optional<model::PackageRecord> SqliteRepository::FindPackageByNode(Transaction& t, const std::string& node_id) {
  Statement st(TX(t).DB(), sql::SELECT_PACKAGE_BY_NODE);
  BindText(st.get(), 1, node_id);
  if (!st.Next()) return std::nullopt;
  return ReadPackage(st.get());
}

std::optional<model::PackageRecord> SqliteRepository::FindPackageByVersion(Transaction& t, const std::string& version,
                                                                           const std::string& exclude_sbom_id) {
  Statement st(TX(t).DB(), sql::SELECT_PACKAGE_BY_VERSION);
  BindText(st.get(), 1, version);
  BindText(st.get(), 2, exclude_sbom_id);
  if (!st.Next()) return std::nullopt;
  return ReadPackage(st.get());
}

} // namespace sbomgraph::db::sqlite
