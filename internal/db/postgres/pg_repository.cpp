#include "pg_repository.hpp"

#include <unordered_map>

#include "internal/db/postgres/pg_statements.hpp"
#include "internal/model/purl.hpp"
#include "internal/util/errors.hpp"

namespace sbomgraph::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, PgTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, PgTransaction::Mode::kRead);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename F>
auto PgRepository::Read(F&& f) -> decltype(f()) {
  try {
    return f();
  } catch (const pqxx::failure& e) {
    throw util::DataAccessError(std::string("postgres read: ") + e.what());
  }
}

template <typename F>
Result PgRepository::Write(F&& f) {
  try {
    f();
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

namespace {

std::vector<std::string> Column0(const pqxx::result& res) {
  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(row[0].c_str());
  return out;
}

std::optional<std::string> First0(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

model::ChecksumRecord ReadChecksum(const pqxx::row& row) {
  model::ChecksumRecord r;
  r.sbom_id = row[0].c_str();
  r.node_id = row[1].c_str();
  r.type    = row[2].c_str();
  r.value   = row[3].c_str();
  return r;
}

model::PackageRecord ReadPackage(const pqxx::row& row) {
  model::PackageRecord r;
  r.sbom_id = row[0].c_str();
  r.node_id = row[1].c_str();
  r.version = row[2].c_str();
  return r;
}

} // namespace

// ------------------------------------------------------------------
// Ingestion
// ------------------------------------------------------------------

Result PgRepository::InsertSourceDocument(Transaction& t, const model::SourceDocumentRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  return Write([&] { TX(t).Work().exec_prepared(kInsertSourceDocument, r.id, r.sha256, r.sha384, r.sha512); });
}

Result PgRepository::InsertSbom(Transaction& t, const model::SbomRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  return Write([&] {
    TX(t).Work().exec_prepared(kInsertSbom, r.sbom_id, r.document_id, r.published, r.source_document_id);
  });
}

Result PgRepository::InsertNode(Transaction& t, const model::NodeRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  return Write([&] { TX(t).Work().exec_prepared(kInsertNode, r.sbom_id, r.node_id, r.name); });
}

Result PgRepository::InsertPackage(Transaction& t, const model::PackageRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  return Write([&] { TX(t).Work().exec_prepared(kInsertPackage, r.sbom_id, r.node_id, r.version); });
}

Result PgRepository::InsertPurlRef(Transaction& t, const model::PurlRefRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  const auto purl = ::sbomgraph::model::CanonicalPurl(r.purl);
  return Write([&] { TX(t).Work().exec_prepared(kInsertPurlRef, r.sbom_id, r.node_id, purl); });
}

Result PgRepository::InsertCpeRef(Transaction& t, const model::CpeRefRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  const auto cpe = ::sbomgraph::model::CanonicalCpe(r.cpe);
  return Write([&] { TX(t).Work().exec_prepared(kInsertCpeRef, r.sbom_id, r.node_id, cpe); });
}

Result PgRepository::InsertExternalNode(Transaction& t, const model::ExternalNodeRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  std::optional<int> discriminator_type;
  if (r.discriminator_type) discriminator_type = static_cast<int>(*r.discriminator_type);

  return Write([&] {
    TX(t).Work().exec_prepared(kInsertExternalNode, r.sbom_id, r.node_id, r.external_doc_ref, r.external_node_ref,
                               static_cast<int>(r.external_type), discriminator_type, r.discriminator_value);
  });
}

Result PgRepository::InsertChecksum(Transaction& t, const model::ChecksumRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  return Write([&] { TX(t).Work().exec_prepared(kInsertChecksum, r.sbom_id, r.node_id, r.type, r.value); });
}

Result PgRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  return Write([&] {
    TX(t).Work().exec_prepared(kInsertRelationship, r.sbom_id, r.left_node_id, r.relationship, r.right_node_id);
  });
}

// ------------------------------------------------------------------
// Graph loading
// ------------------------------------------------------------------

std::vector<std::string> PgRepository::ListSbomIds(Transaction& t) {
  return Read([&] { return Column0(TX(t).Work().exec_prepared(kSelectSbomIds)); });
}

std::optional<model::GraphRows> PgRepository::FetchGraphRows(Transaction& t, const std::string& sbom_id) {
  return Read([&]() -> std::optional<model::GraphRows> {
    auto& w = TX(t).Work();

    auto sbom = w.exec_prepared(kSelectSbom, sbom_id);
    if (sbom.empty()) return std::nullopt;

    model::GraphRows rows;
    rows.sbom.sbom_id            = sbom[0][0].c_str();
    rows.sbom.document_id        = sbom[0][1].c_str();
    rows.sbom.published          = sbom[0][2].c_str();
    rows.sbom.source_document_id = sbom[0][3].c_str();

    std::unordered_map<std::string, std::size_t> index;
    for (const auto& r : w.exec_prepared(kSelectGraphNodes, sbom_id)) {
      model::GraphNodeRow row;
      row.sbom_id = sbom_id;
      row.node_id = r[0].c_str();
      row.name    = r[1].c_str();
      if (r[4].as<bool>()) {
        row.kind              = model::NodeKind::kExternal;
        row.external_doc_ref  = r[5].c_str();
        row.external_node_ref = r[6].c_str();
      } else if (r[2].as<bool>()) {
        row.kind    = model::NodeKind::kPackage;
        row.version = r[3].c_str();
      }
      index.emplace(row.node_id, rows.nodes.size());
      rows.nodes.push_back(std::move(row));
    }

    for (const auto& r : w.exec_prepared(kSelectGraphPurls, sbom_id)) {
      auto it = index.find(r[0].c_str());
      if (it != index.end()) rows.nodes[it->second].purls.emplace_back(r[1].c_str());
    }
    for (const auto& r : w.exec_prepared(kSelectGraphCpes, sbom_id)) {
      auto it = index.find(r[0].c_str());
      if (it != index.end()) rows.nodes[it->second].cpes.emplace_back(r[1].c_str());
    }

    for (const auto& r : w.exec_prepared(kSelectGraphRelationships, sbom_id)) {
      model::RelationshipRecord rel;
      rel.sbom_id       = r[0].c_str();
      rel.left_node_id  = r[1].c_str();
      rel.relationship  = r[2].c_str();
      rel.right_node_id = r[3].c_str();
      rows.relationships.push_back(std::move(rel));
    }

    return rows;
  });
}

// ------------------------------------------------------------------
// Query scoping
// ------------------------------------------------------------------

std::vector<std::string> PgRepository::FindSbomsByNodeId(Transaction& t, const std::string& node_id) {
  return Read([&] { return Column0(TX(t).Work().exec_prepared(kSelectSbomsByNodeId, node_id)); });
}

std::vector<std::string> PgRepository::FindSbomsByName(Transaction& t, const std::string& name) {
  return Read([&] { return Column0(TX(t).Work().exec_prepared(kSelectSbomsByName, name)); });
}

std::vector<std::string> PgRepository::FindSbomsByPurl(Transaction& t, const std::string& purl) {
  const auto key = ::sbomgraph::model::CanonicalPurl(purl);
  return Read([&] { return Column0(TX(t).Work().exec_prepared(kSelectSbomsByPurl, key)); });
}

std::vector<std::string> PgRepository::FindSbomsByCpe(Transaction& t, const std::string& cpe) {
  const auto key = ::sbomgraph::model::CanonicalCpe(cpe);
  return Read([&] { return Column0(TX(t).Work().exec_prepared(kSelectSbomsByCpe, key)); });
}

// ------------------------------------------------------------------
// External reference resolution
// ------------------------------------------------------------------

std::optional<model::ExternalNodeRecord> PgRepository::FindExternalNode(Transaction& t, const std::string& node_id) {
  return Read([&]() -> std::optional<model::ExternalNodeRecord> {
    auto res = TX(t).Work().exec_prepared(kSelectExternalNode, node_id);
    if (res.empty()) return std::nullopt;

    const auto& row = res[0];
    model::ExternalNodeRecord r;
    r.sbom_id           = row[0].c_str();
    r.node_id           = row[1].c_str();
    r.external_doc_ref  = row[2].c_str();
    r.external_node_ref = row[3].c_str();
    r.external_type     = static_cast<model::ExternalType>(row[4].as<int>());
    if (!row[5].is_null()) r.discriminator_type = static_cast<model::DiscriminatorType>(row[5].as<int>());
    if (!row[6].is_null()) r.discriminator_value = std::string(row[6].c_str());
    return r;
  });
}

std::optional<std::string> PgRepository::FindSbomBySourceSha256(Transaction& t, const std::string& sha256) {
  return Read([&] { return First0(TX(t).Work().exec_prepared(kSelectSbomBySourceSha256, sha256)); });
}

std::optional<std::string> PgRepository::FindSbomByDocumentId(Transaction& t, const std::string& document_id) {
  return Read([&] { return First0(TX(t).Work().exec_prepared(kSelectSbomByDocumentId, document_id)); });
}

std::optional<model::ChecksumRecord> PgRepository::FindChecksumByNode(Transaction& t, const std::string& node_id) {
  return Read([&]() -> std::optional<model::ChecksumRecord> {
    auto res = TX(t).Work().exec_prepared(kSelectChecksumByNode, node_id);
    if (res.empty()) return std::nullopt;
    return ReadChecksum(res[0]);
  });
}

std::optional<model::ChecksumRecord> PgRepository::FindChecksumMatch(Transaction& t, const std::string& value,
                                                                     const std::string& exclude_sbom_id) {
  return Read([&]() -> std::optional<model::ChecksumRecord> {
    auto res = TX(t).Work().exec_prepared(kSelectChecksumMatch, value, exclude_sbom_id);
    if (res.empty()) return std::nullopt;
    return ReadChecksum(res[0]);
  });
}

std::optional<model::PackageRecord> PgRepository::FindPackageByNode(Transaction& t, const std::string& node_id) {
  return Read([&]() -> std::optional<model::PackageRecord> {
    auto res = TX(t).Work().exec_prepared(kSelectPackageByNode, node_id);
    if (res.empty()) return std::nullopt;
    return ReadPackage(res[0]);
  });
}

std::optional<model::PackageRecord> PgRepository::FindPackageByVersion(Transaction& t, const std::string& version,
                                                                       const std::string& exclude_sbom_id) {
  return Read([&]() -> std::optional<model::PackageRecord> {
    auto res = TX(t).Work().exec_prepared(kSelectPackageByVersion, version, exclude_sbom_id);
    if (res.empty()) return std::nullopt;
    return ReadPackage(res[0]);
  });
}

} // namespace sbomgraph::db::postgres
