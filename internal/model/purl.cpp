#include "internal/model/purl.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace sbomgraph::model {

namespace {

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool StartsWithNoCase(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) return false;
  return Lower(text.substr(0, prefix.size())) == prefix;
}

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string_view Trim(std::string_view text, char c) {
  while (!text.empty() && text.front() == c) text.remove_prefix(1);
  while (!text.empty() && text.back() == c) text.remove_suffix(1);
  return text;
}

} // namespace

// ------------------------------------------------------------
// Purl
// ------------------------------------------------------------

std::optional<Purl> Purl::Parse(std::string_view text) {
  if (!StartsWithNoCase(text, "pkg:")) {
    return std::nullopt;
  }
  std::string_view rest = text.substr(4);

  Purl purl;

  if (auto hash = rest.find('#'); hash != std::string_view::npos) {
    purl.subpath_ = std::string(Trim(rest.substr(hash + 1), '/'));
    rest          = rest.substr(0, hash);
  }

  if (auto question = rest.find('?'); question != std::string_view::npos) {
    for (auto pair : Split(rest.substr(question + 1), '&')) {
      if (pair.empty()) continue;
      const auto eq = pair.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        return std::nullopt;
      }
      auto value = pair.substr(eq + 1);
      if (value.empty()) continue;
      purl.qualifiers_[Lower(pair.substr(0, eq))] = std::string(value);
    }
    rest = rest.substr(0, question);
  }

  rest = Trim(rest, '/');

  // the version separator is the last '@' of the path; scoped npm names
  // ("%40scope" or "@scope") keep theirs because it precedes a '/'
  const auto at    = rest.rfind('@');
  const auto slash = rest.rfind('/');
  if (at != std::string_view::npos && slash != std::string_view::npos && at > slash) {
    purl.version_ = std::string(rest.substr(at + 1));
    rest          = rest.substr(0, at);
  }

  auto segments = Split(rest, '/');
  segments.erase(std::remove_if(segments.begin(), segments.end(), [](std::string_view s) { return s.empty(); }), segments.end());
  if (segments.size() < 2) {
    return std::nullopt;
  }

  purl.type_ = Lower(segments.front());
  purl.name_ = std::string(segments.back());
  for (std::size_t i = 1; i + 1 < segments.size(); ++i) {
    if (!purl.namespace_.empty()) purl.namespace_ += '/';
    purl.namespace_ += segments[i];
  }

  if (purl.type_.empty() || purl.name_.empty()) {
    return std::nullopt;
  }

  std::string canonical = "pkg:" + purl.type_ + "/";
  if (!purl.namespace_.empty()) {
    canonical += purl.namespace_ + "/";
  }
  canonical += purl.name_;
  if (!purl.version_.empty()) {
    canonical += "@" + purl.version_;
  }
  bool first = true;
  for (const auto& [key, value] : purl.qualifiers_) {
    canonical += first ? '?' : '&';
    canonical += key + "=" + value;
    first = false;
  }
  if (!purl.subpath_.empty()) {
    canonical += "#" + purl.subpath_;
  }
  purl.canonical_ = std::move(canonical);

  return purl;
}

// ------------------------------------------------------------
// Cpe
// ------------------------------------------------------------

std::optional<Cpe> Cpe::Parse(std::string_view text) {
  if (StartsWithNoCase(text, "cpe:2.3:")) {
    // part, vendor, product are mandatory in the formatted string binding
    if (Split(text.substr(8), ':').size() < 3) {
      return std::nullopt;
    }
    return Cpe(Lower(text));
  }

  if (StartsWithNoCase(text, "cpe:/")) {
    if (text.size() == 5) {
      return std::nullopt;
    }
    return Cpe(Lower(text));
  }

  return std::nullopt;
}

std::string CanonicalPurl(std::string_view text) {
  const auto purl = Purl::Parse(text);
  return purl ? purl->ToString() : std::string(text);
}

std::string CanonicalCpe(std::string_view text) {
  const auto cpe = Cpe::Parse(text);
  return cpe ? cpe->ToString() : std::string(text);
}

} // namespace sbomgraph::model
