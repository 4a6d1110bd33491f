#pragma once

#include <string>

namespace sbomgraph::db::model {

// sbom_node: every node of an SBOM, whatever its kind
struct NodeRecord {
  std::string sbom_id;
  std::string node_id;
  std::string name;
};

// sbom_package: nodes that describe a package
struct PackageRecord {
  std::string sbom_id;
  std::string node_id;
  std::string version;
};

struct PurlRefRecord {
  std::string sbom_id;
  std::string node_id;
  std::string purl;
};

struct CpeRefRecord {
  std::string sbom_id;
  std::string node_id;
  std::string cpe;
};

// sbom_node_checksum
struct ChecksumRecord {
  std::string sbom_id;
  std::string node_id;
  std::string type; // "sha256", "md5", ...
  std::string value;
};

} // namespace sbomgraph::db::model
