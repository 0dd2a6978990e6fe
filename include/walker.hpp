#pragma once
#include <memory>
#include <string>
#include <vector>

struct WalkOptions {
  bool recursive = true;
  bool respect_ignore = true;            // .gitignore / .ckignore
  std::vector<std::string> excludes;     // user globs, always honored
};

// Converts a gitignore-style glob to an RE2 pattern (unanchored body).
std::string glob_to_regex(const std::string& glob);

// Compiled set of globs matched against '/'-separated relative paths.
// A glob without '/' matches the final path component at any depth.
class GlobSet {
public:
  GlobSet();
  explicit GlobSet(const std::vector<std::string>& globs);
  ~GlobSet();
  GlobSet(GlobSet&&) noexcept;
  GlobSet& operator=(GlobSet&&) noexcept;

  bool matches(const std::string& rel_path) const;
  bool empty() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Extension blocklist plus a NUL-byte sniff of the first 8 KiB.
bool is_binary_file(const std::string& path);

// Eligible text files under `path` (or `path` itself when it is a file),
// sorted. Never descends into VCS directories or the index directory.
std::vector<std::string> walk_files(const std::string& path, const WalkOptions& options);
