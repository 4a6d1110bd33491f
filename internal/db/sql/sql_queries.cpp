#include "internal/db/sql/sql_queries.hpp"

namespace sbomgraph::db::sql {

std::string NumberPlaceholders(const char* sql) {
  std::string out;
  int         next = 1;
  for (const char* p = sql; *p; ++p) {
    if (*p == '?') {
      out += '$' + std::to_string(next++);
    } else {
      out += *p;
    }
  }
  return out;
}

} // namespace sbomgraph::db::sql
