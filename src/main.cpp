#include "cli.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "embedding_session.hpp"
#include "errors.hpp"
#include "indexer.hpp"
#include "logging.hpp"
#include "maintenance.hpp"
#include "models.hpp"
#include "output.hpp"
#include "reranker.hpp"
#include "search.hpp"
#include "store.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <unistd.h>

static CancelToken g_cancel;

extern "C" void on_interrupt(int) { g_cancel.cancel(); }

// Single status line on stderr, redrawn in place.
class ProgressPrinter : public IndexObserver {
public:
  void on_file_progress(const FileProgress& p) override {
    std::cerr << "\r\033[K[" << p.files_done << "/" << p.files_total << "] " << p.file << std::flush;
    if (p.files_done == p.files_total) std::cerr << "\n";
  }
  void on_chunk_progress(const ChunkProgress& p) override {
    std::cerr << "\r\033[K  embedding " << p.file << " " << p.chunks_done << "/" << p.chunks_total
              << std::flush;
  }
};

class PromptConfirmation : public CleanConfirmation {
public:
  explicit PromptConfirmation(bool assume_yes) : assume_yes_(assume_yes) {}

  bool confirm_clean(const std::string& index_dir, const IndexStats& stats) override {
    if (assume_yes_) return true;
    std::cerr << "remove " << index_dir << " (" << stats.total_files << " files, "
              << stats.total_chunks << " chunks)? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
  }

private:
  bool assume_yes_;
};

static OutputFormat output_format(const Args& a) {
  if (a.json) return OutputFormat::Json;
  if (a.jsonl) return OutputFormat::Jsonl;
  return OutputFormat::Text;
}

static UpdateOptions update_options(const Args& a, const Config& config, const EmbeddingProvider* provider) {
  UpdateOptions o;
  o.force_rebuild = a.force;
  o.excludes = a.search.excludes;
  o.model = provider ? provider->model_id() : std::string();
  o.respect_ignore = a.search.respect_ignore;
  o.verify_content = a.verify;
  o.workers = config.workers;
  o.batch_size = config.batch_size;
  return o;
}

// Indexing keeps going without a model: sidecars then carry chunks only.
static std::unique_ptr<EmbeddingProvider> load_for_indexing(const Config& config) {
  try {
    return load_embedder(config.model, config);
  } catch (const FileAccessError& e) {
    spdlog::warn("{}; indexing without embeddings", e.what());
  } catch (const EmbeddingUnavailable& e) {
    spdlog::warn("{}; indexing without embeddings", e.what());
  }
  return nullptr;
}

static int run_index(const Args& a, const Config& config) {
  auto provider = load_for_indexing(config);
  std::unique_ptr<EmbeddingSession> session;
  if (provider)
    session = std::make_unique<EmbeddingSession>(*provider, config.retry,
                                                 std::chrono::milliseconds(config.embed_timeout_ms), &g_cancel);
  Indexer indexer(session.get(), find_embedding_model(config.model).chunk_config());

  ProgressPrinter progress;
  bool show_progress = !a.quiet && !a.no_progress && isatty(STDERR_FILENO);
  auto result = indexer.update(a.target, update_options(a, config, provider.get()),
                               show_progress ? &progress : nullptr, &g_cancel);

  OutputFormat fmt = output_format(a);
  if (fmt != OutputFormat::Text) {
    print_stats(std::cout, result.stats, true, fmt);
  } else if (!a.quiet) {
    std::cerr << "indexed " << result.stats.files_indexed << " files (" << result.stats.chunks_created
              << " chunks), " << result.stats.files_skipped << " up to date";
    if (!result.failures.empty()) std::cerr << ", " << result.failures.size() << " failed";
    if (!result.degraded.empty()) std::cerr << ", " << result.degraded.size() << " without embeddings";
    std::cerr << "\n";
  }
  return result.failures.empty() ? 0 : 1;
}

static int run_add(const Args& a, const Config& config) {
  auto root = find_index_root(a.target);
  if (!root) throw NotIndexed(a.target);
  auto provider = load_for_indexing(config);
  std::unique_ptr<EmbeddingSession> session;
  if (provider)
    session = std::make_unique<EmbeddingSession>(*provider, config.retry,
                                                 std::chrono::milliseconds(config.embed_timeout_ms), &g_cancel);
  Indexer indexer(session.get(), find_embedding_model(config.model).chunk_config());
  bool rebuilt = indexer.add_file(*root, a.target, update_options(a, config, provider.get()));
  if (!a.quiet) std::cerr << a.target << (rebuilt ? ": indexed" : ": up to date") << "\n";
  return 0;
}

static int run_search(const Args& a, const Config& config) {
  const SearchOptions& opts = a.search;
  std::unique_ptr<EmbeddingProvider> provider;
  std::unique_ptr<EmbeddingSession> session;
  std::unique_ptr<Reranker> reranker;

  switch (opts.mode) {
    case SearchMode::Regex:
    case SearchMode::Lexical:
      break;
    case SearchMode::Semantic:
    case SearchMode::Hybrid:
      // report a missing index before paying for a model load
      for (auto& p : opts.paths)
        if (!find_index_root(p)) throw NotIndexed(p);
      provider = load_embedder(config.model, config);
      session = std::make_unique<EmbeddingSession>(*provider, config.retry,
                                                   std::chrono::milliseconds(config.embed_timeout_ms), &g_cancel);
      if (opts.rerank)
        reranker = load_reranker(opts.rerank_model.empty() ? config.rerank_model : opts.rerank_model, config);
      break;
  }

  SearchEngine engine(session.get(), reranker.get(), config);
  auto out = engine.search(opts);
  print_results(std::cout, out, opts, output_format(a));

  if (out.results.empty() && out.near_miss && !a.quiet) {
    const auto& nm = *out.near_miss;
    std::cerr << "no matches above the threshold; closest: " << nm.file << ":" << nm.line_start
              << " (score " << nm.score << ")\n";
  }
  spdlog::info("{} matches in {} of {} files ({} ms, {} mode)", out.summary.total_matches,
               out.summary.files_with_matches, out.summary.files_searched, out.summary.duration.count(),
               mode_name(opts.mode));

  if (opts.files_without_matches) return out.files_without_matches.empty() ? 1 : 0;
  return out.results.empty() ? 1 : 0;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  std::signal(SIGINT, on_interrupt);

  try {
    init_logging("warn");
    Config config = load_config(args.config_path);
    init_logging(config.log_level);
    if (args.verbose) set_log_level("debug");
    else if (args.quiet) set_log_level("error");
    if (!args.model.empty()) config.model = args.model;
    if (args.workers) config.workers = *args.workers;

    switch (args.command) {
      case Command::Search:
        return run_search(args, config);
      case Command::Index:
        return run_index(args, config);
      case Command::Add:
        return run_add(args, config);
      case Command::Status:
        print_stats(std::cout, index_status(args.target), args.status_verbose, output_format(args));
        return 0;
      case Command::Clean: {
        PromptConfirmation confirm(args.yes || args.quiet);
        auto r = clean_index(args.target, confirm);
        if (!args.quiet) std::cerr << (r.cleaned ? "index removed\n" : "nothing removed\n");
        return r.cleaned ? 0 : 1;
      }
      case Command::CleanOrphans: {
        size_t n = clean_orphans(args.target);
        if (!args.quiet) std::cerr << "removed " << n << " orphaned sidecars\n";
        return 0;
      }
      case Command::Inspect: {
        auto info = inspect_file(args.target, find_embedding_model(config.model).chunk_config());
        print_inspection(std::cout, info, output_format(args));
        return 0;
      }
    }
  } catch (const Cancelled&) {
    std::cerr << "\nck: interrupted\n";
    return 130;
  } catch (const std::exception& e) {
    std::cerr << "ck: " << e.what() << "\n";
    return 2;
  }
  return 2;
}
