#include "memory_repository.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

#include "memory_tx.hpp"
#include "internal/model/purl.hpp"

namespace sbomgraph::db::memory {

namespace {

std::string NodeKey(const std::string& sbom_id, const std::string& node_id) {
  return sbom_id + '\0' + node_id;
}

template <typename Records, typename Pred>
std::vector<std::string> DistinctSboms(const Records& records, Pred pred) {
  std::set<std::string> ids;
  for (const auto& r : records) {
    if (pred(r)) ids.insert(r.sbom_id);
  }
  return {ids.begin(), ids.end()};
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Ingestion
// ------------------------------------------------------------------

Result MemoryRepository::InsertSourceDocument(Transaction& t, const model::SourceDocumentRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto& s = TX(t).Mutable();
  if (s.source_documents.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.source_documents[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertSbom(Transaction& t, const model::SbomRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto& s = TX(t).Mutable();
  if (s.sboms.contains(r.sbom_id)) return Result::Err(ErrorCode::AlreadyExists);
  if (!r.source_document_id.empty() && !s.source_documents.contains(r.source_document_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown source document " + r.source_document_id);
  }
  s.sboms[r.sbom_id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertNode(Transaction& t, const model::NodeRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto& s = TX(t).Mutable();
  if (!s.sboms.contains(r.sbom_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown sbom " + r.sbom_id);
  const bool duplicate = std::any_of(s.nodes.begin(), s.nodes.end(), [&](const model::NodeRecord& n) {
    return n.sbom_id == r.sbom_id && n.node_id == r.node_id;
  });
  if (duplicate) return Result::Err(ErrorCode::AlreadyExists);
  s.nodes.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertPackage(Transaction& t, const model::PackageRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  TX(t).Mutable().packages.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertPurlRef(Transaction& t, const model::PurlRefRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto row = r;
  row.purl = ::sbomgraph::model::CanonicalPurl(r.purl);
  TX(t).Mutable().purls.push_back(std::move(row));
  return Result::Ok();
}

Result MemoryRepository::InsertCpeRef(Transaction& t, const model::CpeRefRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  auto row = r;
  row.cpe = ::sbomgraph::model::CanonicalCpe(r.cpe);
  TX(t).Mutable().cpes.push_back(std::move(row));
  return Result::Ok();
}

Result MemoryRepository::InsertExternalNode(Transaction& t, const model::ExternalNodeRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  TX(t).Mutable().external_nodes.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertChecksum(Transaction& t, const model::ChecksumRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  TX(t).Mutable().checksums.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  if (t.IsReadOnly()) return Result::ReadOnlyTransaction();
  TX(t).Mutable().relationships.push_back(r);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Graph loading
// ------------------------------------------------------------------

std::vector<std::string> MemoryRepository::ListSbomIds(Transaction& t) {
  std::vector<std::string> ids;
  for (const auto& [id, _] : TX(t).View().sboms) ids.push_back(id);
  return ids;
}

std::optional<model::GraphRows> MemoryRepository::FetchGraphRows(Transaction& t, const std::string& sbom_id) {
  const auto& s   = TX(t).View();
  auto        sbom = s.sboms.find(sbom_id);
  if (sbom == s.sboms.end()) return std::nullopt;

  model::GraphRows rows;
  rows.sbom = sbom->second;

  std::unordered_map<std::string, std::size_t> index;
  for (const auto& n : s.nodes) {
    if (n.sbom_id != sbom_id) continue;
    model::GraphNodeRow row;
    row.sbom_id = n.sbom_id;
    row.node_id = n.node_id;
    row.name    = n.name;
    index.emplace(NodeKey(n.sbom_id, n.node_id), rows.nodes.size());
    rows.nodes.push_back(std::move(row));
  }

  auto find = [&](const std::string& node_id) -> model::GraphNodeRow* {
    auto it = index.find(NodeKey(sbom_id, node_id));
    return it == index.end() ? nullptr : &rows.nodes[it->second];
  };

  for (const auto& p : s.packages) {
    if (p.sbom_id != sbom_id) continue;
    if (auto* row = find(p.node_id)) {
      row->kind    = model::NodeKind::kPackage;
      row->version = p.version;
    }
  }
  for (const auto& p : s.purls) {
    if (p.sbom_id != sbom_id) continue;
    if (auto* row = find(p.node_id)) row->purls.push_back(p.purl);
  }
  for (const auto& c : s.cpes) {
    if (c.sbom_id != sbom_id) continue;
    if (auto* row = find(c.node_id)) row->cpes.push_back(c.cpe);
  }
  for (const auto& e : s.external_nodes) {
    if (e.sbom_id != sbom_id) continue;
    if (auto* row = find(e.node_id)) {
      row->kind              = model::NodeKind::kExternal;
      row->external_doc_ref  = e.external_doc_ref;
      row->external_node_ref = e.external_node_ref;
    }
  }

  for (const auto& r : s.relationships) {
    if (r.sbom_id == sbom_id) rows.relationships.push_back(r);
  }

  return rows;
}

// ------------------------------------------------------------------
// Query scoping
// ------------------------------------------------------------------

std::vector<std::string> MemoryRepository::FindSbomsByNodeId(Transaction& t, const std::string& node_id) {
  return DistinctSboms(TX(t).View().nodes, [&](const model::NodeRecord& n) { return n.node_id == node_id; });
}

std::vector<std::string> MemoryRepository::FindSbomsByName(Transaction& t, const std::string& name) {
  return DistinctSboms(TX(t).View().nodes, [&](const model::NodeRecord& n) { return n.name == name; });
}

std::vector<std::string> MemoryRepository::FindSbomsByPurl(Transaction& t, const std::string& purl) {
  const auto key = ::sbomgraph::model::CanonicalPurl(purl);
  return DistinctSboms(TX(t).View().purls, [&](const model::PurlRefRecord& p) { return p.purl == key; });
}

std::vector<std::string> MemoryRepository::FindSbomsByCpe(Transaction& t, const std::string& cpe) {
  const auto key = ::sbomgraph::model::CanonicalCpe(cpe);
  return DistinctSboms(TX(t).View().cpes, [&](const model::CpeRefRecord& c) { return c.cpe == key; });
}

// ------------------------------------------------------------------
// External reference resolution
// ------------------------------------------------------------------

std::optional<model::ExternalNodeRecord> MemoryRepository::FindExternalNode(Transaction& t, const std::string& node_id) {
  for (const auto& e : TX(t).View().external_nodes) {
    if (e.node_id == node_id) return e;
  }
  return std::nullopt;
}

std::optional<std::string> MemoryRepository::FindSbomBySourceSha256(Transaction& t, const std::string& sha256) {
  const auto& s = TX(t).View();
  for (const auto& [id, sbom] : s.sboms) {
    auto doc = s.source_documents.find(sbom.source_document_id);
    if (doc != s.source_documents.end() && doc->second.sha256 == sha256) return id;
  }
  return std::nullopt;
}

std::optional<std::string> MemoryRepository::FindSbomByDocumentId(Transaction& t, const std::string& document_id) {
  for (const auto& [id, sbom] : TX(t).View().sboms) {
    if (sbom.document_id == document_id) return id;
  }
  return std::nullopt;
}

std::optional<model::ChecksumRecord> MemoryRepository::FindChecksumByNode(Transaction& t, const std::string& node_id) {
  for (const auto& c : TX(t).View().checksums) {
    if (c.node_id == node_id) return c;
  }
  return std::nullopt;
}

std::optional<model::ChecksumRecord> MemoryRepository::FindChecksumMatch(Transaction& t, const std::string& value,
                                                                         const std::string& exclude_sbom_id) {
  for (const auto& c : TX(t).View().checksums) {
    if (c.value == value && c.sbom_id != exclude_sbom_id) return c;
  }
  return std::nullopt;
}

std::optional<model::PackageRecord> MemoryRepository::FindPackageByNode(Transaction& t, const std::string& node_id) {
  for (const auto& p : TX(t).View().packages) {
    if (p.node_id == node_id) return p;
  }
  return std::nullopt;
}

std::optional<model::PackageRecord> MemoryRepository::FindPackageByVersion(Transaction& t, const std::string& version,
                                                                           const std::string& exclude_sbom_id) {
  for (const auto& p : TX(t).View().packages) {
    if (p.version == version && p.sbom_id != exclude_sbom_id) return p;
  }
  return std::nullopt;
}

} // namespace sbomgraph::db::memory
