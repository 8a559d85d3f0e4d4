#include "store_backend.hpp"

namespace docsync {

bool QueryPredicate::matches(const std::string& relative_path) const {
  if(scope == Scope::Item) return relative_path == path;
  if(path.empty()) return true;
  return relative_path.compare(0, path.size(), path) == 0;
}

std::string QueryPredicate::describe() const {
  if(scope == Scope::Item) return "item '" + path + "'";
  return path.empty() ? std::string("container") : "prefix '" + path + "'";
}

const char* to_string(MetadataEvent event) {
  switch(event) {
    case MetadataEvent::GatheringProgress: return "gathering-progress";
    case MetadataEvent::GatheringFinished: return "gathering-finished";
    case MetadataEvent::Updated: return "updated";
  }
  return "unknown";
}

} // namespace docsync
