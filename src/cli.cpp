#include "cli.hpp"
#include <cstdlib>
#include <iostream>
#include <vector>

static const char* USAGE =
"usage: ck [options] <pattern> [paths...]\n"
"       ck --index [path]          build or refresh the index (--reindex forces a full rebuild)\n"
"       ck --status [path]         index statistics (--status-verbose lists orphans)\n"
"       ck --clean [path]          remove the index (asks unless --yes)\n"
"       ck --clean-orphans [path]  remove sidecars of deleted files\n"
"       ck --add <file>            index one file\n"
"       ck --inspect <file>        show how a file is chunked\n"
"\n"
"search modes: --regex (default) --lex --sem --hybrid\n"
"matching:     -i -F -w -r --no-recursive --exclude GLOB --no-ignore\n"
"ranking:      --topk N (--limit N) --threshold X --rerank --rerank-model NAME --model NAME\n"
"output:       -n -H --no-filename -l -L -A N -B N -C N --scores --json --jsonl\n"
"general:      --config FILE --workers N --verify --yes -q -v --no-progress -h\n";

[[noreturn]] static void usage_error(const std::string& msg) {
  if (!msg.empty()) std::cerr << "ck: " << msg << "\n";
  std::cerr << USAGE;
  std::exit(2);
}

static int to_int(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used == v.size() && n >= 0) return n;
  } catch (const std::exception&) {
  }
  usage_error("expected a non-negative integer after " + flag + ", got '" + v + "'");
}

static float to_float(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    float x = std::stof(v, &used);
    if (used == v.size()) return x;
  } catch (const std::exception&) {
  }
  usage_error("expected a number after " + flag + ", got '" + v + "'");
}

static void set_command(Args& a, Command c, bool& seen) {
  if (seen) usage_error("only one of --index/--status/--clean/--clean-orphans/--add/--inspect may be given");
  a.command = c;
  seen = true;
}

Args parse_cli(int argc, char** argv) {
  Args a;
  SearchOptions& s = a.search;
  std::vector<std::string> positional;
  bool command_seen = false;
  bool only_positional = false;

  int i = 1;
  while (i < argc) {
    std::string f = argv[i++];
    if (only_positional || f.empty() || f[0] != '-' || f == "-") { positional.push_back(f); continue; }
    auto next = [&](std::string& dst) {
      if (i >= argc) usage_error("missing value after " + f);
      dst = argv[i++];
    };
    std::string v;

    if (f == "--") only_positional = true;
    else if (f == "-h" || f == "--help") { std::cout << USAGE; std::exit(0); }
    // commands
    else if (f == "--index") set_command(a, Command::Index, command_seen);
    else if (f == "--reindex") { set_command(a, Command::Index, command_seen); a.force = true; }
    else if (f == "--status") set_command(a, Command::Status, command_seen);
    else if (f == "--status-verbose") { set_command(a, Command::Status, command_seen); a.status_verbose = true; }
    else if (f == "--clean") set_command(a, Command::Clean, command_seen);
    else if (f == "--clean-orphans") set_command(a, Command::CleanOrphans, command_seen);
    else if (f == "--add") set_command(a, Command::Add, command_seen);
    else if (f == "--inspect") set_command(a, Command::Inspect, command_seen);
    // modes
    else if (f == "--regex") s.mode = SearchMode::Regex;
    else if (f == "--lex") s.mode = SearchMode::Lexical;
    else if (f == "--sem") s.mode = SearchMode::Semantic;
    else if (f == "--hybrid") s.mode = SearchMode::Hybrid;
    // matching
    else if (f == "-i" || f == "--ignore-case") s.case_insensitive = true;
    else if (f == "-F" || f == "--fixed-strings") s.fixed_string = true;
    else if (f == "-w" || f == "--word-regexp") s.word_regexp = true;
    else if (f == "-r" || f == "-R" || f == "--recursive") s.recursive = true;
    else if (f == "--no-recursive") s.recursive = false;
    else if (f == "--exclude") { next(v); s.excludes.push_back(v); }
    else if (f == "--no-ignore") s.respect_ignore = false;
    // ranking
    else if (f == "--topk" || f == "--limit") { next(v); s.topk = to_int(f, v); }
    else if (f == "--threshold") { next(v); s.threshold = to_float(f, v); }
    else if (f == "--rerank") s.rerank = true;
    else if (f == "--rerank-model") { next(v); s.rerank_model = v; s.rerank = true; }
    else if (f == "--model") next(a.model);
    // output
    else if (f == "-n" || f == "--line-number") s.line_numbers = true;
    else if (f == "-H") s.show_filenames = true;
    else if (f == "--no-filename") s.show_filenames = false;
    else if (f == "-l" || f == "--files-with-matches") s.files_with_matches = true;
    else if (f == "-L" || f == "--files-without-matches") s.files_without_matches = true;
    else if (f == "-A" || f == "--after-context") { next(v); s.after_context = to_int(f, v); }
    else if (f == "-B" || f == "--before-context") { next(v); s.before_context = to_int(f, v); }
    else if (f == "-C" || f == "--context") { next(v); s.before_context = s.after_context = to_int(f, v); }
    else if (f == "--scores") s.show_scores = true;
    else if (f == "--json") a.json = true;
    else if (f == "--jsonl") a.jsonl = true;
    // general
    else if (f == "--config") next(a.config_path);
    else if (f == "--workers") { next(v); a.workers = to_int(f, v); }
    else if (f == "--verify") a.verify = true;
    else if (f == "-y" || f == "--yes") a.yes = true;
    else if (f == "-q" || f == "--quiet") a.quiet = true;
    else if (f == "-v" || f == "--verbose") a.verbose = true;
    else if (f == "--no-progress") a.no_progress = true;
    else usage_error("unknown flag: " + f);
  }

  if (s.files_with_matches && s.files_without_matches) usage_error("-l and -L are exclusive");
  if (a.json && a.jsonl) usage_error("--json and --jsonl are exclusive");

  if (a.command == Command::Search) {
    if (positional.empty()) usage_error("missing pattern");
    s.query = positional[0];
    s.paths.assign(positional.begin() + 1, positional.end());
    if (s.paths.empty()) s.paths.push_back(".");
  } else {
    if (positional.size() > 1) usage_error("too many arguments");
    if (!positional.empty()) a.target = positional[0];
    else if (a.command == Command::Add || a.command == Command::Inspect) usage_error("missing file");
  }
  return a;
}
