#include "walker.hpp"
#include "store.hpp"
#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

using std::string;
namespace fs = std::filesystem;

namespace {

bool is_binary_ext(const string& ext) {
  static const char* bad[] = {".png",".jpg",".jpeg",".gif",".bmp",".ico",".tif",".tiff",".webp",
                              ".pdf",".zip",".gz",".tgz",".bz2",".xz",".7z",".tar",".jar",
                              ".mp4",".mov",".avi",".mp3",".wav",".ogg",".flac",
                              ".bin",".so",".dll",".dylib",".a",".o",".obj",".exe",".class",
                              ".pyc",".wasm",".gguf",".onnx",".sqlite",".db",".woff",".woff2",".ttf"};
  for (auto* b : bad) if (ext == b) return true;
  return false;
}

bool is_skipped_dir(const string& name) {
  return name == ".git" || name == ".hg" || name == ".svn" || name == kIndexDirName;
}

struct IgnoreRule {
  std::unique_ptr<RE2> re;
  bool negate;
  bool dir_only;
};

// Rules of one .gitignore/.ckignore, relative to the directory holding it.
struct IgnoreFile {
  fs::path base;
  std::vector<IgnoreRule> rules;
};

std::unique_ptr<RE2> compile_glob(const string& glob) {
  bool anchored = glob.find('/') != string::npos;
  string body = glob;
  if (!body.empty() && body.front() == '/') body.erase(0, 1);
  string pattern = anchored ? "^" + glob_to_regex(body) + "$"
                            : "^(?:.*/)?" + glob_to_regex(body) + "$";
  auto re = std::make_unique<RE2>(pattern, RE2::Quiet);
  if (!re->ok()) {
    spdlog::warn("ignoring invalid glob '{}': {}", glob, re->error());
    return nullptr;
  }
  return re;
}

IgnoreFile load_ignore_file(const fs::path& file) {
  IgnoreFile out;
  out.base = file.parent_path();
  std::ifstream in(file);
  string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    while (!line.empty() && line.back() == ' ') line.pop_back();
    if (line.empty() || line[0] == '#') continue;
    IgnoreRule r{nullptr, false, false};
    if (line[0] == '!') { r.negate = true; line.erase(0, 1); }
    if (!line.empty() && line.back() == '/') { r.dir_only = true; line.pop_back(); }
    if (line.empty()) continue;
    r.re = compile_glob(line);
    if (r.re) out.rules.push_back(std::move(r));
  }
  return out;
}

string generic_rel(const fs::path& p, const fs::path& base) {
  return p.lexically_relative(base).generic_string();
}

class Walker {
public:
  Walker(const fs::path& root, const WalkOptions& options)
    : root_(root), options_(options), excludes_(options.excludes) {}

  void run(std::vector<string>& out) { visit(root_, out); }

private:
  bool ignored(const fs::path& p, bool is_dir) const {
    if (!excludes_.empty() && excludes_.matches(generic_rel(p, root_))) return true;
    bool result = false;
    // later files (deeper directories) and later lines take precedence
    for (auto& f : stack_) {
      string rel = generic_rel(p, f.base);
      for (auto& r : f.rules) {
        if (r.dir_only && !is_dir) continue;
        if (RE2::FullMatch(rel, *r.re)) result = !r.negate;
      }
    }
    return result;
  }

  void visit(const fs::path& dir, std::vector<string>& out) {
    size_t pushed = 0;
    if (options_.respect_ignore) {
      for (const char* name : {".gitignore", ".ckignore"}) {
        std::error_code ec;
        if (fs::is_regular_file(dir / name, ec)) {
          stack_.push_back(load_ignore_file(dir / name));
          ++pushed;
        }
      }
    }

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
      entries.push_back(*it);
    if (ec) spdlog::warn("cannot list {}: {}", dir.string(), ec.message());
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (auto& e : entries) {
      std::error_code sec;
      if (e.is_directory(sec)) {
        if (e.is_symlink(sec) || is_skipped_dir(e.path().filename().string())) continue;
        if (!options_.recursive) continue;
        if (ignored(e.path(), true)) continue;
        visit(e.path(), out);
      } else if (e.is_regular_file(sec)) {
        if (ignored(e.path(), false)) continue;
        if (is_binary_file(e.path().string())) continue;
        out.push_back(e.path().string());
      }
    }
    stack_.resize(stack_.size() - pushed);
  }

  fs::path root_;
  const WalkOptions& options_;
  GlobSet excludes_;
  std::vector<IgnoreFile> stack_;
};

}

string glob_to_regex(const string& glob) {
  string out;
  for (size_t i = 0; i < glob.size(); ++i) {
    char c = glob[i];
    if (c == '*') {
      if (i + 1 < glob.size() && glob[i + 1] == '*') {
        ++i;
        if (i + 1 < glob.size() && glob[i + 1] == '/') { ++i; out += "(?:.*/)?"; }
        else out += ".*";
      } else {
        out += "[^/]*";
      }
    } else if (c == '?') {
      out += "[^/]";
    } else if (c == '[') {
      size_t close = glob.find(']', i + 1);
      if (close == string::npos) { out += "\\["; continue; }
      string cls = glob.substr(i + 1, close - i - 1);
      if (!cls.empty() && cls[0] == '!') cls[0] = '^';
      out += "[" + cls + "]";
      i = close;
    } else {
      out += RE2::QuoteMeta(string(1, c));
    }
  }
  return out;
}

struct GlobSet::Impl {
  std::vector<std::unique_ptr<RE2>> res;
};

GlobSet::GlobSet() : impl_(new Impl) {}

GlobSet::GlobSet(const std::vector<string>& globs) : impl_(new Impl) {
  for (auto& g : globs) {
    string body = g;
    if (body.size() > 1 && body.back() == '/') body.pop_back();
    if (auto re = compile_glob(body)) impl_->res.push_back(std::move(re));
  }
}

GlobSet::~GlobSet() = default;
GlobSet::GlobSet(GlobSet&&) noexcept = default;
GlobSet& GlobSet::operator=(GlobSet&&) noexcept = default;

bool GlobSet::matches(const string& rel_path) const {
  for (auto& re : impl_->res) if (RE2::FullMatch(rel_path, *re)) return true;
  return false;
}

bool GlobSet::empty() const { return impl_->res.empty(); }

bool is_binary_file(const string& path) {
  auto ext = fs::path(path).extension().string();
  for (auto& c : ext) c = (char)std::tolower((unsigned char)c);
  if (is_binary_ext(ext)) return true;

  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  char buf[8192];
  in.read(buf, sizeof(buf));
  return std::find(buf, buf + in.gcount(), '\0') != buf + in.gcount();
}

std::vector<string> walk_files(const string& path, const WalkOptions& options) {
  std::vector<string> out;
  std::error_code ec;
  fs::path p(path);
  if (fs::is_regular_file(p, ec)) {
    if (!is_binary_file(path)) out.push_back(path);
    return out;
  }
  if (!fs::is_directory(p, ec)) return out;

  Walker w(p, options);
  w.run(out);
  return out;
}
