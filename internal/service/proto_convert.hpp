#pragma once

#include "sbomgraph/analysis/v1/analysis.pb.h"

#include "internal/analysis/query_options.hpp"
#include "internal/model/node.hpp"
#include "internal/model/pagination.hpp"
#include "internal/query/graph_query.hpp"

namespace sbomgraph::service {

// Throws util::InvalidArgument when no query is set or it does not parse.
query::GraphQuery ToGraphQuery(const sbomgraph::analysis::v1::RetrieveRequest& req);

// Throws util::InvalidArgument on unknown relationship names.
analysis::QueryOptions ToQueryOptions(const sbomgraph::analysis::v1::RetrieveRequest& req);

model::Paginated ToPage(const sbomgraph::analysis::v1::RetrieveRequest& req);

void ToProto(const model::AnalysisNode& node, sbomgraph::analysis::v1::Node* out);

}
