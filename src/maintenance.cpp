#include "maintenance.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace {
SidecarStore open_store(const std::string& path) {
  auto root = find_index_root(path);
  if (!root) throw NotIndexed(path);
  return SidecarStore(*root);
}
}

IndexStats index_status(const std::string& path) {
  return open_store(path).stats(path);
}

CleanResult clean_index(const std::string& path, CleanConfirmation& confirmation) {
  SidecarStore store = open_store(path);
  IndexStats stats = store.stats(path);
  size_t sidecars = store.sidecars(path).size();
  std::string scope = store.scope_dir(path);
  CleanResult result;
  if (!confirmation.confirm_clean(scope, stats)) {
    spdlog::info("clean of {} declined", scope);
    return result;
  }
  store.clean(path);
  result.cleaned = true;
  result.sidecars_removed = sidecars;
  result.bytes_freed = stats.index_size_bytes;
  return result;
}

size_t clean_orphans(const std::string& path) {
  auto root = find_index_root(path);
  if (!root) return 0;
  return SidecarStore(*root).clean_orphans(path);
}
