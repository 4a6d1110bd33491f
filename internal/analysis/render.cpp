#include "internal/analysis/render.hpp"

#include <sstream>

#include "internal/util/overloaded.hpp"

namespace sbomgraph::analysis {

namespace {

std::string Escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '"' || c == '\\') out += '\\';
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out += c;
  }
  return out;
}

std::string Label(const model::Node& node) {
  return std::visit(util::Overloaded{
                        [](const model::PackageNode& p) {
                          if (p.version.empty()) return Escape(p.name);
                          return Escape(p.name) + "\\n" + Escape(p.version);
                        },
                        [](const model::ExternalNode& e) {
                          return Escape(e.name) + "\\n-> " + Escape(e.external_document_reference);
                        },
                        [](const model::UnknownNode& u) { return Escape(u.name); },
                    },
                    node);
}

const char* Shape(const model::Node& node) {
  if (std::holds_alternative<model::PackageNode>(node)) return "box";
  if (std::holds_alternative<model::ExternalNode>(node)) return "ellipse, style=dashed";
  return "ellipse";
}

} // namespace

std::string RenderDot(const graph::PackageGraph& graph) {
  std::ostringstream out;
  out << "digraph \"" << Escape(graph.SbomId()) << "\" {\n";

  for (graph::NodeIndex i = 0; i < graph.NodeCount(); ++i) {
    const auto& node = graph.NodeAt(i);
    out << "  n" << i << " [label=\"" << Label(node) << "\", shape=" << Shape(node)
        << ", tooltip=\"" << Escape(model::Base(node).node_id) << "\"];\n";
  }

  for (std::size_t e = 0; e < graph.EdgeCount(); ++e) {
    const auto& edge = graph.EdgeAt(e);
    out << "  n" << edge.source << " -> n" << edge.target << " [label=\"" << model::ToString(edge.relationship)
        << "\"];\n";
  }

  out << "}\n";
  return out.str();
}

} // namespace sbomgraph::analysis
