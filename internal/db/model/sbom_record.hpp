#pragma once

#include <string>

namespace sbomgraph::db::model {

/*
  One ingested SBOM document.

  document_id is the document's own namespace / serial number
  (for CycloneDX "urn:cdx:<serial>/<version>").
*/
struct SbomRecord {
  std::string sbom_id;
  std::string document_id;
  std::string published;
  std::string source_document_id;
};

// Checksums of the file the SBOM was ingested from.
struct SourceDocumentRecord {
  std::string id;
  std::string sha256;
  std::string sha384;
  std::string sha512;
};

} // namespace sbomgraph::db::model
