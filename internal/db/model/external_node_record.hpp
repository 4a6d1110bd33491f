#pragma once

#include <optional>
#include <string>

namespace sbomgraph::db::model {

// Ecosystem that produced the external reference. Stored as an integer.
enum class ExternalType : int {
  kSpdx             = 0,
  kCycloneDx        = 1,
  kProductComponent = 2,
};

enum class DiscriminatorType : int {
  kSha256 = 0,
  kSha384 = 1,
  kSha512 = 2,
  kMd5    = 3,
};

/*
  sbom_external_node

  SPDX:       external_doc_ref is the DocumentRef id, the discriminator
              carries the referenced document's checksum.
  CycloneDX:  external_doc_ref is the BOM serial, the discriminator value
              its version.
  Product component: external_node_ref names a node whose checksum or
              package version is shared with the real component.
*/
struct ExternalNodeRecord {
  std::string                      sbom_id;
  std::string                      node_id;
  std::string                      external_doc_ref;
  std::string                      external_node_ref;
  ExternalType                     external_type = ExternalType::kSpdx;
  std::optional<DiscriminatorType> discriminator_type;
  std::optional<std::string>       discriminator_value;
};

} // namespace sbomgraph::db::model
