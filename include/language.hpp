#pragma once
#include <string>
#include <vector>

enum class Language {
  Text, C, Cpp, CSharp, Go, Java, JavaScript, TypeScript, Python, Ruby, Rust,
  Shell, Markdown
};

// Detection is by extension (and a few well-known file names). Anything
// unrecognized is Text, which the chunker handles with plain windows.
Language detect_language(const std::string& path);
const char* language_name(Language lang);

struct SymbolRegion {
  std::string kind;   // "function", "class", "struct", "impl", ...
  std::string name;
  int first_line;     // 0-based, inclusive
  int last_line;      // 0-based, inclusive
};

// Outermost function/class-like definitions, sorted and non-overlapping.
// Empty when the language has no structural rules or nothing matched.
std::vector<SymbolRegion> find_symbols(Language lang, const std::vector<std::string>& lines);
