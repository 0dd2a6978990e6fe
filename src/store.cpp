#include "store.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* kTempMarker = ".tmp.";

// Raised inside this file only; read() maps it to "absent", write() to FileAccessError.
struct SqliteError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Db {
  sqlite3* db = nullptr;

  Db(const std::string& path, int flags) {
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
      std::string e = db ? sqlite3_errmsg(db) : "out of memory";
      sqlite3_close(db);
      db = nullptr;
      throw SqliteError("sqlite open failed: " + e);
    }
  }
  ~Db() { if (db) sqlite3_close(db); }

  void exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string e = err ? err : "unknown";
      sqlite3_free(err);
      throw SqliteError(std::string("sqlite exec: ") + e);
    }
  }
};

struct Stmt {
  sqlite3_stmt* st = nullptr;

  Stmt(Db& db, const char* sql) {
    if (sqlite3_prepare_v2(db.db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw SqliteError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db.db));
  }
  ~Stmt() { sqlite3_finalize(st); }

  // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws
  bool step() {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SqliteError("sqlite step failed (" + std::to_string(rc) + ")");
  }
  void reset() { sqlite3_reset(st); sqlite3_clear_bindings(st); }

  std::string text(int col) {
    auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
    return p ? std::string(p, (size_t)sqlite3_column_bytes(st, col)) : std::string();
  }
};

const char* kSchemaSql =
  "CREATE TABLE meta ("
  " key TEXT PRIMARY KEY,"
  " value TEXT NOT NULL"
  ");"
  "CREATE TABLE chunks ("
  " idx INTEGER PRIMARY KEY,"
  " line_start INTEGER NOT NULL,"
  " line_end INTEGER NOT NULL,"
  " symbol_kind TEXT,"
  " symbol_name TEXT,"
  " text TEXT NOT NULL,"
  " embedding BLOB"
  ");";

std::string unique_temp_suffix() {
  static std::atomic<uint64_t> counter{0};
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return std::string(kTempMarker) + std::to_string(::getpid()) + "." +
         std::to_string(tid % 100000) + "." + std::to_string(counter++);
}

bool is_temp(const fs::path& p) {
  return p.filename().string().find(kTempMarker) != std::string::npos;
}

bool is_sidecar(const fs::path& p) {
  auto name = p.filename().string();
  size_t n = std::strlen(kSidecarSuffix);
  return !is_temp(p) && name.size() > n && name.compare(name.size() - n, n, kSidecarSuffix) == 0;
}

std::optional<std::string> meta_value(Db& db, const char* key) {
  Stmt st(db, "SELECT value FROM meta WHERE key=?");
  sqlite3_bind_text(st.st, 1, key, -1, SQLITE_STATIC);
  if (!st.step()) return std::nullopt;
  return st.text(0);
}

std::string require_meta(Db& db, const char* key) {
  auto v = meta_value(db, key);
  if (!v) throw SqliteError(std::string("missing meta key ") + key);
  return *v;
}

// Opens a published sidecar and checks its schema version. nullopt when the
// version differs.
std::optional<size_t> checked_chunk_count(Db& db) {
  auto version = meta_value(db, "schema_version");
  if (!version || std::stoi(*version) != kSchemaVersion) return std::nullopt;
  return (size_t)std::stoull(require_meta(db, "chunk_count"));
}

// Prunes empty subdirectories; `dir` itself stays.
void remove_empty_dirs(const fs::path& dir) {
  std::error_code ec;
  std::vector<fs::path> subdirs;
  for (auto& e : fs::directory_iterator(dir, ec)) {
    if (e.is_directory(ec)) subdirs.push_back(e.path());
  }
  for (auto& d : subdirs) {
    remove_empty_dirs(d);
    if (fs::is_empty(d, ec)) fs::remove(d, ec);
  }
}

}

SidecarStore::SidecarStore(const std::string& root)
  : root_(fs::weakly_canonical(fs::absolute(root)).string()) {}

std::string SidecarStore::index_dir() const {
  return (fs::path(root_) / kIndexDirName).string();
}

bool SidecarStore::exists() const {
  std::error_code ec;
  return fs::is_directory(index_dir(), ec);
}

std::string SidecarStore::sidecar_path(const std::string& file) const {
  fs::path abs = fs::weakly_canonical(fs::absolute(file));
  fs::path rel = abs.lexically_relative(root_);
  if (rel.empty() || *rel.begin() == "..")
    throw FileAccessError(file, "index", "file is outside the index root " + root_);
  fs::path p = fs::path(index_dir()) / rel;
  p += kSidecarSuffix;
  return p.string();
}

std::string SidecarStore::source_path(const std::string& sidecar) const {
  fs::path rel = fs::path(sidecar).lexically_relative(index_dir());
  std::string s = (fs::path(root_) / rel).string();
  size_t n = std::strlen(kSidecarSuffix);
  if (s.size() > n && s.compare(s.size() - n, n, kSidecarSuffix) == 0) s.resize(s.size() - n);
  return s;
}

std::optional<SidecarEntry> SidecarStore::read(const std::string& file) const {
  std::string path;
  try {
    path = sidecar_path(file);
  } catch (const FileAccessError&) {
    return std::nullopt;
  }
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return std::nullopt;

  try {
    Db db(path, SQLITE_OPEN_READONLY);
    auto count = checked_chunk_count(db);
    if (!count) {
      spdlog::debug("sidecar {} has another schema version, treating as absent", path);
      return std::nullopt;
    }

    SidecarEntry e;
    e.fingerprint.content_hash = require_meta(db, "content_hash");
    e.fingerprint.size = std::stoull(require_meta(db, "size"));
    e.fingerprint.mtime_ns = std::stoll(require_meta(db, "mtime_ns"));
    e.fingerprint.model_id = require_meta(db, "model_id");
    int dim = std::stoi(require_meta(db, "dim"));

    Stmt st(db, "SELECT line_start, line_end, symbol_kind, symbol_name, text, embedding "
                "FROM chunks ORDER BY idx");
    size_t with_vec = 0;
    while (st.step()) {
      Chunk c;
      c.span.line_start = sqlite3_column_int(st.st, 0);
      c.span.line_end = sqlite3_column_int(st.st, 1);
      if (sqlite3_column_type(st.st, 2) != SQLITE_NULL)
        c.symbol = Symbol{st.text(2), st.text(3)};
      c.text = st.text(4);
      e.chunks.push_back(std::move(c));

      if (sqlite3_column_type(st.st, 5) != SQLITE_NULL) {
        int bytes = sqlite3_column_bytes(st.st, 5);
        if (dim <= 0 || bytes != dim * (int)sizeof(float)) return std::nullopt;
        const auto* p = static_cast<const float*>(sqlite3_column_blob(st.st, 5));
        e.embeddings.emplace_back(p, p + dim);
        ++with_vec;
      }
    }
    if (e.chunks.size() != *count) return std::nullopt;
    if (with_vec != 0 && with_vec != e.chunks.size()) return std::nullopt;
    return e;
  } catch (const std::exception& ex) {
    // SqliteError or a malformed number: the entry is unusable, rebuild it
    spdlog::debug("unreadable sidecar {}: {}", path, ex.what());
    return std::nullopt;
  }
}

void SidecarStore::write(const std::string& file, const SidecarEntry& entry) const {
  if (!entry.embeddings.empty() && entry.embeddings.size() != entry.chunks.size())
    throw IndexingFailed(file, "embedding count does not match chunk count");

  std::string final_path = sidecar_path(file);
  std::error_code ec;
  fs::create_directories(fs::path(final_path).parent_path(), ec);
  if (ec) throw FileAccessError(final_path, "create directory for", ec.message());

  std::string tmp = final_path + unique_temp_suffix();
  try {
    {
      Db db(tmp, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
      db.exec("PRAGMA journal_mode=OFF;");
      db.exec("PRAGMA synchronous=FULL;");
      db.exec(kSchemaSql);
      db.exec("BEGIN;");

      int dim = entry.embeddings.empty() ? 0 : (int)entry.embeddings.front().size();
      {
        Stmt st(db, "INSERT INTO meta (key, value) VALUES (?, ?)");
        auto put = [&](const char* k, const std::string& v) {
          sqlite3_bind_text(st.st, 1, k, -1, SQLITE_STATIC);
          sqlite3_bind_text(st.st, 2, v.c_str(), -1, SQLITE_TRANSIENT);
          st.step();
          st.reset();
        };
        put("schema_version", std::to_string(entry.schema_version));
        put("content_hash", entry.fingerprint.content_hash);
        put("size", std::to_string(entry.fingerprint.size));
        put("mtime_ns", std::to_string(entry.fingerprint.mtime_ns));
        put("model_id", entry.fingerprint.model_id);
        put("dim", std::to_string(dim));
        put("chunk_count", std::to_string(entry.chunks.size()));
        put("source", fs::absolute(file).string());
      }
      {
        Stmt st(db,
          "INSERT INTO chunks (idx, line_start, line_end, symbol_kind, symbol_name, text, embedding) "
          "VALUES (?, ?, ?, ?, ?, ?, ?)");
        for (size_t i = 0; i < entry.chunks.size(); ++i) {
          const Chunk& c = entry.chunks[i];
          sqlite3_bind_int64(st.st, 1, (sqlite3_int64)i);
          sqlite3_bind_int(st.st, 2, c.span.line_start);
          sqlite3_bind_int(st.st, 3, c.span.line_end);
          if (c.symbol) {
            sqlite3_bind_text(st.st, 4, c.symbol->kind.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st.st, 5, c.symbol->name.c_str(), -1, SQLITE_TRANSIENT);
          }
          sqlite3_bind_text(st.st, 6, c.text.data(), (int)c.text.size(), SQLITE_TRANSIENT);
          if (!entry.embeddings.empty()) {
            const auto& v = entry.embeddings[i];
            if ((int)v.size() != dim) throw SqliteError("embeddings have mixed dimensions");
            sqlite3_bind_blob(st.st, 7, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
          }
          st.step();
          st.reset();
        }
      }
      db.exec("COMMIT;");
    }
    fs::rename(tmp, final_path);
  } catch (const std::exception& ex) {
    fs::remove(tmp, ec);
    throw FileAccessError(final_path, "write sidecar", ex.what());
  }
}

bool SidecarStore::remove(const std::string& file) const {
  std::error_code ec;
  return fs::remove(sidecar_path(file), ec);
}

// Empty when `under` is empty or names the root itself.
fs::path SidecarStore::scope_relative(const std::string& under) const {
  if (under.empty()) return fs::path();
  fs::path abs = fs::weakly_canonical(fs::absolute(under));
  fs::path rel = abs.lexically_relative(root_);
  if (rel.empty() || *rel.begin() == "..")
    throw FileAccessError(under, "index", "path is outside the index root " + root_);
  if (rel == ".") return fs::path();
  return rel;
}

std::string SidecarStore::scope_dir(const std::string& under) const {
  return (fs::path(index_dir()) / scope_relative(under)).lexically_normal().string();
}

std::vector<std::string> SidecarStore::sidecars(const std::string& under) const {
  std::vector<std::string> out;
  if (!exists()) return out;
  fs::path rel = scope_relative(under);
  fs::path base = fs::path(index_dir()) / rel;
  std::error_code ec;

  if (!rel.empty() && !fs::is_directory(base, ec)) {
    // a single file, possibly already deleted
    fs::path single = base;
    single += kSidecarSuffix;
    if (fs::is_regular_file(single, ec)) out.push_back(single.string());
    return out;
  }
  for (auto it = fs::recursive_directory_iterator(base, ec);
       it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    if (it->is_regular_file(ec) && is_sidecar(it->path())) out.push_back(it->path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

IndexStats SidecarStore::stats(const std::string& under) const {
  IndexStats s;
  std::error_code ec;
  for (auto& sc : sidecars(under)) {
    s.index_size_bytes += fs::file_size(sc, ec);
    auto mtime = fs::last_write_time(sc, ec);
    if (!ec && (!s.last_modified || mtime > *s.last_modified)) s.last_modified = mtime;

    if (!fs::exists(source_path(sc), ec)) {
      s.orphaned_files.push_back(sc);
      continue;
    }
    try {
      Db db(sc, SQLITE_OPEN_READONLY);
      if (auto n = checked_chunk_count(db)) {
        s.total_files++;
        s.total_chunks += *n;
      } else {
        spdlog::debug("stats: {} has another schema version", sc);
      }
    } catch (const std::exception& ex) {
      spdlog::debug("stats: unreadable sidecar {}: {}", sc, ex.what());
    }
  }
  return s;
}

void SidecarStore::clean(const std::string& under) const {
  std::error_code ec;
  if (scope_relative(under).empty()) {
    fs::remove_all(index_dir(), ec);
    if (ec) throw FileAccessError(index_dir(), "remove", ec.message());
    spdlog::info("removed index {}", index_dir());
    return;
  }
  size_t removed = 0;
  for (auto& sc : sidecars(under)) {
    if (!fs::remove(sc, ec) && ec) throw FileAccessError(sc, "remove", ec.message());
    ++removed;
  }
  remove_empty_dirs(index_dir());
  spdlog::info("removed {} sidecars under {}", removed, scope_dir(under));
}

size_t SidecarStore::clean_orphans(const std::string& under) const {
  if (!exists()) return 0;
  size_t removed = 0;
  std::error_code ec;

  fs::path base = scope_dir(under);
  std::vector<fs::path> temps;
  if (fs::is_directory(base, ec)) {
    for (auto it = fs::recursive_directory_iterator(base, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) break;
      if (it->is_regular_file(ec) && is_temp(it->path())) temps.push_back(it->path());
    }
  }
  for (auto& t : temps) {
    spdlog::debug("removing abandoned temporary {}", t.string());
    fs::remove(t, ec);
  }

  for (auto& sc : sidecars(under)) {
    if (fs::exists(source_path(sc), ec)) continue;
    if (fs::remove(sc, ec)) {
      ++removed;
      spdlog::debug("removed orphaned sidecar {}", sc);
    } else if (ec) {
      spdlog::warn("cannot remove orphaned sidecar {}: {}", sc, ec.message());
    }
  }
  remove_empty_dirs(index_dir());
  return removed;
}

std::optional<std::string> find_index_root(const std::string& path) {
  std::error_code ec;
  fs::path p = fs::weakly_canonical(fs::absolute(path), ec);
  if (ec) p = fs::absolute(path);
  if (!fs::is_directory(p, ec)) p = p.parent_path();
  while (true) {
    if (fs::is_directory(p / kIndexDirName, ec)) return p.string();
    if (!p.has_parent_path() || p.parent_path() == p) return std::nullopt;
    p = p.parent_path();
  }
}
