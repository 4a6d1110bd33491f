#include "proto_convert.hpp"

#include "internal/util/errors.hpp"

namespace sbomgraph::service {

using namespace sbomgraph::analysis::v1;

query::GraphQuery ToGraphQuery(const RetrieveRequest& req) {
  switch (req.query_case()) {
    case RetrieveRequest::kComponent:
      return query::ParseComponentReference(req.component());
    case RetrieveRequest::kNodeId:
      return query::ComponentReference{query::ComponentId{req.node_id()}};
    case RetrieveRequest::kQ:
      return query::FilterExpression::Parse(req.q());
    case RetrieveRequest::QUERY_NOT_SET:
      break;
  }
  throw util::InvalidArgument("one of component, node_id or q is required");
}

analysis::QueryOptions ToQueryOptions(const RetrieveRequest& req) {
  analysis::QueryOptions options;
  if (req.has_ancestors()) options.ancestors = req.ancestors();
  if (req.has_descendants()) options.descendants = req.descendants();
  options.relationships = model::ParseRelationships({req.relationships().begin(), req.relationships().end()});
  return options;
}

model::Paginated ToPage(const RetrieveRequest& req) {
  return model::Paginated{req.offset(), req.limit()};
}

static void ToProto(const std::vector<model::AnalysisNode>& nodes, NodeList* out) {
  for (const auto& node : nodes) {
    ToProto(node, out->add_items());
  }
}

void ToProto(const model::AnalysisNode& node, Node* out) {
  const auto& base = node.base;
  out->set_sbom_id(base.sbom_id);
  out->set_node_id(base.node_id);
  out->set_name(base.name);
  out->set_version(base.version);
  for (const auto& purl : base.purl) out->add_purl(purl);
  for (const auto& cpe : base.cpe) out->add_cpe(cpe);
  out->set_document_id(base.document_id);
  out->set_published(base.published);

  if (node.relationship) {
    out->set_relationship(std::string(model::ToString(*node.relationship)));
  }
  if (node.ancestors) {
    ToProto(*node.ancestors, out->mutable_ancestors());
  }
  if (node.descendants) {
    ToProto(*node.descendants, out->mutable_descendants());
  }
}

}
