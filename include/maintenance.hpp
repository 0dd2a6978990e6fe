#pragma once
#include "store.hpp"
#include <string>

// Asked before a full clean. The front end decides how (prompt, --yes).
class CleanConfirmation {
public:
  virtual ~CleanConfirmation() = default;
  virtual bool confirm_clean(const std::string& index_dir, const IndexStats& stats) = 0;
};

struct CleanResult {
  bool cleaned = false;       // false when the confirmation declined
  size_t sidecars_removed = 0;
  uint64_t bytes_freed = 0;
};

// `path` may be the index root or anything below it; the operations only
// look at the sidecars for `path`, never at the rest of the enclosing index.

// Stats of the sidecars for `path`. Throws NotIndexed.
IndexStats index_status(const std::string& path);

// Removes the sidecars for `path` once confirmed; at the root that is the
// whole index directory. Throws NotIndexed.
CleanResult clean_index(const std::string& path, CleanConfirmation& confirmation);

// Removes sidecars of deleted files. Returns how many went; 0 when there is no index.
size_t clean_orphans(const std::string& path);
