#pragma once

#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/node.hpp"

namespace sbomgraph::resolve {

/*
  Finds the SBOM and node an external reference node stands for.

  SPDX:       sha256 discriminator -> SBOM whose source document has
              that checksum; target node is external_node_ref.
  CycloneDX:  document id "urn:cdx:<doc_ref>/<discriminator_value>";
              target node is external_node_ref.
  Product component:
              checksum of the referenced node -> another SBOM's node
              with the same checksum; without a checksum row, the
              referenced package's version -> another SBOM's package
              with that version.

  The product component path is a heuristic: unrelated SBOMs sharing a
  checksum or a version resolve to each other, and the first match wins.

  A miss is nullopt. Data access failures propagate.
*/
std::optional<model::ResolvedSbom> ResolveExternalSbom(db::Repository& repo, db::Transaction& tx,
                                                       const std::string& node_id);

} // namespace sbomgraph::resolve
