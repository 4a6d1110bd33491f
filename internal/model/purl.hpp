#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sbomgraph::model {

/*
  Package URL.

    pkg:type/namespace/name@version?qualifiers#subpath

  Two purls are equal when their canonical strings are equal: the type is
  lower-cased, qualifier keys are lower-cased and sorted, empty qualifier
  values are dropped.
*/
class Purl {
 public:
  static std::optional<Purl> Parse(std::string_view text);

  const std::string& Type() const {
    return type_;
  }
  const std::string& Namespace() const {
    return namespace_;
  }
  const std::string& Name() const {
    return name_;
  }
  const std::string& Version() const {
    return version_;
  }
  const std::map<std::string, std::string>& Qualifiers() const {
    return qualifiers_;
  }
  const std::string& Subpath() const {
    return subpath_;
  }

  const std::string& ToString() const {
    return canonical_;
  }

  bool operator==(const Purl& other) const {
    return canonical_ == other.canonical_;
  }
  bool operator<(const Purl& other) const {
    return canonical_ < other.canonical_;
  }

 private:
  Purl() = default;

  std::string                        type_;
  std::string                        namespace_;
  std::string                        name_;
  std::string                        version_;
  std::map<std::string, std::string> qualifiers_;
  std::string                        subpath_;
  std::string                        canonical_;
};

/*
  Common Platform Enumeration name, either the 2.2 URI binding
  (cpe:/a:vendor:product:version) or the 2.3 formatted string
  (cpe:2.3:a:vendor:product:version:...). Compared case-insensitively.
*/
class Cpe {
 public:
  static std::optional<Cpe> Parse(std::string_view text);

  const std::string& ToString() const {
    return value_;
  }

  bool operator==(const Cpe& other) const {
    return value_ == other.value_;
  }
  bool operator<(const Cpe& other) const {
    return value_ < other.value_;
  }

 private:
  explicit Cpe(std::string value) : value_(std::move(value)) {
  }

  std::string value_;
};

// Storage and lookup form of purl / cpe text. Text that does not parse is
// returned unchanged.
std::string CanonicalPurl(std::string_view text);
std::string CanonicalCpe(std::string_view text);

} // namespace sbomgraph::model
