#include "language.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace {

enum class Extent { Brace, Indent, EndKeyword, Heading };

struct Rule {
  const char* kind;
  std::unique_ptr<RE2> re;   // exactly one capture group: the symbol name
};

struct LanguageRules {
  Extent extent;
  bool single_quote_strings;  // false where ' is a lifetime/char prefix we can't track
  std::vector<Rule> rules;
};

void add(LanguageRules& lr, const char* kind, const char* pattern) {
  lr.rules.push_back(Rule{kind, std::make_unique<RE2>(pattern)});
}

// Built once; RE2 objects are safe to share across threads for matching.
const LanguageRules* rules_for(Language lang) {
  static const auto table = [] {
    std::vector<std::unique_ptr<LanguageRules>> t(static_cast<size_t>(Language::Markdown) + 1);
    auto make = [&](Language l, Extent e, bool sq) -> LanguageRules& {
      t[static_cast<size_t>(l)] = std::make_unique<LanguageRules>();
      auto& lr = *t[static_cast<size_t>(l)];
      lr.extent = e;
      lr.single_quote_strings = sq;
      return lr;
    };

    const char* c_type =
      R"(^(?:class|struct|union|enum(?:\s+class)?)\s+(?:\[\[[^\]]*\]\]\s*)?([A-Za-z_]\w*)[^;]*$)";
    const char* c_func =
      R"(^(?:template\s*<.*>\s*)?(?:[A-Za-z_][\w:<>,\*&\s]*[\s\*&])?([A-Za-z_~][\w:~]*)\s*\([^;]*$)";
    for (Language l : {Language::C, Language::Cpp}) {
      auto& lr = make(l, Extent::Brace, true);
      add(lr, "class", c_type);
      add(lr, "function", c_func);
    }

    auto& cs = make(Language::CSharp, Extent::Brace, true);
    add(cs, "class", R"(^\s*(?:(?:public|private|protected|internal|static|abstract|sealed|partial|readonly)\s+)*(?:class|interface|enum|record|struct)\s+([A-Za-z_]\w*))");

    auto& java = make(Language::Java, Extent::Brace, true);
    add(java, "class", R"(^\s*(?:(?:public|private|protected|static|abstract|final|sealed)\s+)*(?:class|interface|enum|record)\s+([A-Za-z_]\w*))");

    auto& go = make(Language::Go, Extent::Brace, true);
    add(go, "function", R"(^func\s+(?:\([^)]*\)\s*)?([A-Za-z_]\w*))");
    add(go, "type", R"(^type\s+([A-Za-z_]\w*)\s+(?:struct|interface))");

    for (Language l : {Language::JavaScript, Language::TypeScript}) {
      auto& lr = make(l, Extent::Brace, true);
      add(lr, "function", R"(^\s*(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*))");
      add(lr, "class", R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+([A-Za-z_$][\w$]*))");
      add(lr, "function", R"(^(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=]*)?=\s*(?:async\s*)?(?:\([^)]*\)|[A-Za-z_$][\w$]*)\s*(?::[^=]*)?=>)");
      if (l == Language::TypeScript) {
        add(lr, "interface", R"(^\s*(?:export\s+)?interface\s+([A-Za-z_$][\w$]*))");
        add(lr, "enum", R"(^\s*(?:export\s+)?(?:const\s+)?enum\s+([A-Za-z_$][\w$]*))");
      }
    }

    auto& rust = make(Language::Rust, Extent::Brace, false);
    add(rust, "function", R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\s+([A-Za-z_]\w*))");
    add(rust, "struct", R"(^\s*(?:pub(?:\([^)]*\))?\s+)?struct\s+([A-Za-z_]\w*))");
    add(rust, "enum", R"(^\s*(?:pub(?:\([^)]*\))?\s+)?enum\s+([A-Za-z_]\w*))");
    add(rust, "trait", R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:unsafe\s+)?trait\s+([A-Za-z_]\w*))");
    add(rust, "impl", R"(^\s*(?:unsafe\s+)?impl(?:<[^>]*>)?\s+(?:[\w:<>, ]+\s+for\s+)?([A-Za-z_][\w:]*))");
    add(rust, "module", R"(^\s*(?:pub(?:\([^)]*\))?\s+)?mod\s+([A-Za-z_]\w*)\s*\{)");

    auto& py = make(Language::Python, Extent::Indent, true);
    add(py, "function", R"(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*))");
    add(py, "class", R"(^\s*class\s+([A-Za-z_]\w*))");

    auto& rb = make(Language::Ruby, Extent::EndKeyword, true);
    add(rb, "function", R"(^\s*def\s+((?:self\.)?[A-Za-z_]\w*[?!=]?))");
    add(rb, "class", R"(^\s*class\s+([A-Z][\w:]*))");
    add(rb, "module", R"(^\s*module\s+([A-Z][\w:]*))");

    auto& sh = make(Language::Shell, Extent::Brace, true);
    add(sh, "function", R"(^\s*(?:function\s+)?([A-Za-z_][\w-]*)\s*\(\)\s*\{?\s*$)");
    add(sh, "function", R"(^\s*function\s+([A-Za-z_][\w-]*)\s*\{?\s*$)");

    auto& md = make(Language::Markdown, Extent::Heading, true);
    add(md, "section", R"(^#{1,6}\s+(.+?)\s*#*\s*$)");
    return t;
  }();
  return table[static_cast<size_t>(lang)].get();
}

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

int indent_of(const std::string& s) {
  int n = 0;
  for (char c : s) {
    if (c == ' ') n += 1;
    else if (c == '\t') n += 8 - (n % 8);
    else break;
  }
  return n;
}

const char* kBlockKeywords[] = {"if", "for", "while", "switch", "return", "else", "do",
                                "case", "catch", "sizeof", "using", "typedef", "namespace"};

bool starts_with_keyword(const std::string& line) {
  size_t i = line.find_first_not_of(" \t");
  if (i == std::string::npos) return false;
  size_t j = i;
  while (j < line.size() && (std::isalnum((unsigned char)line[j]) || line[j] == '_')) ++j;
  std::string word = line.substr(i, j - i);
  for (auto* k : kBlockKeywords) if (word == k) return true;
  return false;
}

// Last line of the brace block opened at or shortly after `start`, or -1 when
// the definition turns out to be a declaration (';' before any '{').
int brace_extent(const std::vector<std::string>& lines, int start, bool single_quotes) {
  const int max_lookahead = 8;
  int depth = 0;
  bool opened = false;
  bool block_comment = false;
  for (int i = start; i < (int)lines.size(); ++i) {
    if (!opened && i - start > max_lookahead) return -1;
    const std::string& l = lines[i];
    char quote = 0;
    for (size_t k = 0; k < l.size(); ++k) {
      char c = l[k];
      char next = k + 1 < l.size() ? l[k + 1] : 0;
      if (block_comment) {
        if (c == '*' && next == '/') { block_comment = false; ++k; }
        continue;
      }
      if (quote) {
        if (c == '\\') ++k;
        else if (c == quote) quote = 0;
        continue;
      }
      if (c == '/' && next == '/') break;
      if (c == '/' && next == '*') { block_comment = true; ++k; continue; }
      if (c == '"' || c == '`' || (c == '\'' && single_quotes)) { quote = c; continue; }
      if (c == '{') { ++depth; opened = true; }
      else if (c == '}') {
        --depth;
        if (opened && depth <= 0) return i;
      } else if (c == ';' && !opened && depth == 0) {
        return -1;
      }
    }
  }
  return -1;
}

int indent_extent(const std::vector<std::string>& lines, int start) {
  int base = indent_of(lines[start]);
  int parens = 0;
  int last = start;
  for (int i = start; i < (int)lines.size(); ++i) {
    const std::string& l = lines[i];
    if (i > start && parens <= 0 && !is_blank(l) && indent_of(l) <= base) break;
    for (char c : l) {
      if (c == '(' || c == '[' || c == '{') ++parens;
      else if (c == ')' || c == ']' || c == '}') --parens;
    }
    if (!is_blank(l)) last = i;
  }
  return last > start ? last : -1;
}

int end_keyword_extent(const std::vector<std::string>& lines, int start) {
  int base = indent_of(lines[start]);
  for (int i = start + 1; i < (int)lines.size(); ++i) {
    const std::string& l = lines[i];
    if (is_blank(l)) continue;
    if (indent_of(l) == base) {
      size_t p = l.find_first_not_of(" \t");
      if (l.compare(p, 3, "end") == 0 &&
          (p + 3 == l.size() || !std::isalnum((unsigned char)l[p + 3]))) return i;
      return -1;
    }
    if (indent_of(l) < base) return -1;
  }
  return -1;
}

int heading_extent(const std::vector<std::string>& lines, int start, const RE2& heading) {
  int last = start;
  for (int i = start + 1; i < (int)lines.size(); ++i) {
    if (RE2::PartialMatch(lines[i], heading)) break;
    if (!is_blank(lines[i])) last = i;
  }
  return last;
}

}

Language detect_language(const std::string& path) {
  fs::path p(path);
  std::string name = p.filename().string();
  std::string ext = p.extension().string();
  for (auto& c : ext) c = (char)std::tolower((unsigned char)c);

  if (name == "Makefile" || name == "Dockerfile") return Language::Text;
  if (name == "Rakefile" || name == "Gemfile") return Language::Ruby;

  if (ext == ".c" || ext == ".h") return Language::C;
  if (ext == ".cc" || ext == ".cpp" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" ||
      ext == ".hxx" || ext == ".ipp" || ext == ".inl") return Language::Cpp;
  if (ext == ".cs") return Language::CSharp;
  if (ext == ".go") return Language::Go;
  if (ext == ".java") return Language::Java;
  if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs") return Language::JavaScript;
  if (ext == ".ts" || ext == ".tsx") return Language::TypeScript;
  if (ext == ".py" || ext == ".pyi") return Language::Python;
  if (ext == ".rb") return Language::Ruby;
  if (ext == ".rs") return Language::Rust;
  if (ext == ".sh" || ext == ".bash" || ext == ".zsh") return Language::Shell;
  if (ext == ".md" || ext == ".markdown") return Language::Markdown;
  return Language::Text;
}

const char* language_name(Language lang) {
  switch (lang) {
    case Language::Text: return "text";
    case Language::C: return "c";
    case Language::Cpp: return "cpp";
    case Language::CSharp: return "csharp";
    case Language::Go: return "go";
    case Language::Java: return "java";
    case Language::JavaScript: return "javascript";
    case Language::TypeScript: return "typescript";
    case Language::Python: return "python";
    case Language::Ruby: return "ruby";
    case Language::Rust: return "rust";
    case Language::Shell: return "shell";
    case Language::Markdown: return "markdown";
  }
  return "text";
}

std::vector<SymbolRegion> find_symbols(Language lang, const std::vector<std::string>& lines) {
  std::vector<SymbolRegion> out;
  const LanguageRules* lr = rules_for(lang);
  if (!lr) return out;

  int claimed = -1;
  for (int i = 0; i < (int)lines.size(); ++i) {
    if (i <= claimed || is_blank(lines[i])) continue;
    if (lr->extent == Extent::Brace && starts_with_keyword(lines[i])) continue;

    for (auto& rule : lr->rules) {
      std::string name;
      if (!RE2::PartialMatch(lines[i], *rule.re, &name)) continue;

      int last = -1;
      switch (lr->extent) {
        case Extent::Brace: last = brace_extent(lines, i, lr->single_quote_strings); break;
        case Extent::Indent: last = indent_extent(lines, i); break;
        case Extent::EndKeyword: last = end_keyword_extent(lines, i); break;
        case Extent::Heading: last = heading_extent(lines, i, *rule.re); break;
      }
      if (last < i) continue;

      out.push_back(SymbolRegion{rule.kind, name, i, last});
      claimed = last;
      break;
    }
  }
  return out;
}
