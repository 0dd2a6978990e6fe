#pragma once
#include "indexer.hpp"
#include "search.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <ostream>

enum class OutputFormat { Text, Json, Jsonl };

nlohmann::json result_to_json(const SearchResult& r);
nlohmann::json stats_to_json(const IndexStats& s);

// grep-like text, a JSON array, or one JSON object per line.
void print_results(std::ostream& out, const SearchOutput& res, const SearchOptions& options,
                   OutputFormat format);

void print_stats(std::ostream& out, const IndexStats& stats, bool verbose, OutputFormat format);
void print_inspection(std::ostream& out, const FileInspection& info, OutputFormat format);
