#pragma once
#include "search.hpp"
#include <optional>
#include <string>

enum class Command { Search, Index, Status, Clean, CleanOrphans, Add, Inspect };

struct Args {
  Command command = Command::Search;
  SearchOptions search;          // pattern and paths for Command::Search
  std::string target = ".";      // path for the maintenance commands

  bool force = false;            // --reindex
  bool verify = false;           // hash every file even when size+mtime match
  bool status_verbose = false;
  bool yes = false;
  bool quiet = false;
  bool verbose = false;
  bool no_progress = false;
  bool json = false;
  bool jsonl = false;

  std::string config_path;
  std::string model;             // overrides Config::model
  std::optional<int> workers;
};

// Exits with status 2 and usage text on malformed input, 0 on --help.
Args parse_cli(int argc, char** argv);
