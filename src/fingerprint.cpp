#include "fingerprint.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx new_sha256() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("sha256: digest init failed");
  return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, md, &len) != 1) throw std::runtime_error("sha256: digest final failed");
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out += hex[md[i] >> 4];
    out += hex[md[i] & 0xF];
  }
  return out;
}
}

FileState stat_file(const std::string& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) throw FileAccessError(path, "stat", ec.message());
  auto mtime = fs::last_write_time(path, ec);
  if (ec) throw FileAccessError(path, "stat", ec.message());
  FileState st;
  st.size = (uint64_t)size;
  st.mtime_ns = (int64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(
                    mtime.time_since_epoch()).count();
  return st;
}

std::string sha256_hex(const std::string& bytes) {
  auto ctx = new_sha256();
  if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1)
    throw std::runtime_error("sha256: digest update failed");
  return finish_hex(ctx.get());
}

std::string hash_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw FileAccessError(path, "read", "cannot open file");
  auto ctx = new_sha256();
  char buf[64 * 1024];
  while (in) {
    in.read(buf, sizeof(buf));
    auto n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf, (size_t)n) != 1)
      throw std::runtime_error("sha256: digest update failed");
  }
  if (in.bad()) throw FileAccessError(path, "read", "I/O error");
  return finish_hex(ctx.get());
}

bool metadata_matches(const Fingerprint& stored, const FileState& current) {
  return stored.size == current.size && stored.mtime_ns == current.mtime_ns;
}

Freshness check_freshness(const Fingerprint& stored, const std::string& path,
                          const std::string& model_id, bool verify_content) {
  if (stored.model_id != model_id) return Freshness::Stale;

  auto st = stat_file(path);
  bool same_meta = metadata_matches(stored, st);
  if (same_meta && !verify_content) return Freshness::Fresh;
  if (stored.size != st.size) return Freshness::Stale;

  if (hash_file(path) != stored.content_hash) return Freshness::Stale;
  return same_meta ? Freshness::Fresh : Freshness::Touched;
}
