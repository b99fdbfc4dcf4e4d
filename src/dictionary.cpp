/**
 * @file dictionary.cpp
 * @brief Word-list dictionary with optional Hunspell backend
 */

#include "wenjiao/dictionary.hpp"
#include "wenjiao/hasher.hpp"
#include "wenjiao/text_utils.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iostream>

namespace wenjiao {

namespace {

// Tried in order when the configuration names no word list
constexpr const char *kDefaultWordLists[] = {
    "/usr/share/hunspell/en_US.dic",
    "/usr/share/dict/american-english",
    "/usr/share/dict/words",
};

// Always loaded: function words and academic vocabulary that word lists
// shipped by minimal systems tend to miss
// clang-format off
constexpr const char *kBuiltinVocabulary[] = {
    // Function words
    "the", "and", "that", "have", "for", "not", "with", "you", "this", "but",
    "his", "from", "they", "say", "her", "she", "will", "one", "all",
    "would", "there", "their", "what", "out", "about", "who", "get", "which",
    "when", "make", "can", "like", "time", "just", "him", "know", "take",
    "people", "into", "year", "your", "good", "some", "could", "them", "see",
    "other", "than", "then", "now", "look", "only", "come", "its", "over",
    "think", "also", "back", "after", "use", "two", "how", "our", "work",
    "first", "well", "way", "even", "new", "want", "because", "any", "these",
    "give", "day", "most", "are", "was", "were", "been", "being", "has",
    "had", "does", "did", "may", "might", "must", "should", "shall", "such",
    "each", "both", "between", "through", "during", "before", "under",
    "while", "where", "whether", "however", "therefore", "thus", "hence",
    "although", "though", "since", "within", "without", "among", "across",
    "against", "toward", "towards", "upon", "here", "more", "less", "many",
    "much", "very", "same", "different", "several", "various", "three",
    "four", "five", "second", "third", "last", "next", "those", "whose",
    "whom", "why", "yet", "still", "often", "always", "never", "again",
    "further", "based", "using", "used", "show", "shows", "shown", "found",
    "given", "known", "high", "low", "large", "small", "long", "short",
    "important", "main", "major", "general", "specific", "common", "possible",
    "mean", "means", "meant", "meaning",

    // Academic writing
    "research", "analysis", "data", "method", "methods", "result", "results",
    "conclusion", "study", "studies", "theory", "hypothesis", "experiment",
    "experimental", "variable", "correlation", "significant", "evidence",
    "framework", "implementation", "development", "environment", "financial",
    "economic", "corporate", "business", "management", "strategy",
    "performance", "technology", "innovation", "sustainable", "organization",
    "industry", "production", "consumption", "investment", "marketing",
    "behavior", "psychology", "sociology", "political", "government",
    "regulation", "international", "global", "regional", "national",
    "population", "demographic", "environmental", "sustainability",
    "resources", "energy", "efficient", "renewable", "pollution",
    "conservation", "biodiversity", "ecosystem", "climate", "temperature",
    "atmosphere", "emissions", "carbon", "footprint", "digital", "computer",
    "software", "hardware", "network", "internet", "database", "algorithm",
    "programming", "artificial", "intelligence", "machine", "learning",
    "robotics", "automation", "virtual", "reality", "augmented",
    "simulation", "modeling", "prediction", "forecasting", "optimization",
    "efficiency", "effectiveness", "productivity", "quality", "reliability",
    "validity", "accuracy", "precision", "measurement", "evaluation",
    "assessment", "synthesis", "integration", "execution", "operation",
    "maintenance", "improvement", "enhancement", "geographic", "endowment",
    "asset", "allocation", "empirical", "share", "listed", "model", "paper",
    "approach", "system", "process", "problem", "question", "sample",
    "review", "literature", "abstract", "introduction", "discussion",
    "appendix", "table", "figure", "section", "chapter", "reference",
    "references", "proposed", "propose", "present", "presents", "effect",
    "effects", "impact", "factor", "factors", "level", "rate", "value",
    "test", "tests", "statistical", "regression", "estimate", "estimation",
    "robust", "control", "group", "period", "policy", "market", "firm",
    "firms", "social", "degree", "centrality", "neural", "deep",
    "training", "feature", "features", "graph", "node", "nodes", "edge",
    "edges", "function", "parameter", "parameters", "dataset", "baseline",
};
// clang-format on

constexpr std::size_t kDictMinWordLen = 2;
constexpr std::size_t kDictMaxWordLen = 40;

/// Extracts the word from a hunspell .dic line ("word/flags")
std::string_view extract_word(std::string_view line) {
  auto slash_pos = line.find('/');
  if (slash_pos != std::string_view::npos) {
    return line.substr(0, slash_pos);
  }
  return line;
}

/// Letters plus inner apostrophes and hyphens
bool is_dictionary_word(std::string_view s) {
  for (char c : s) {
    if (!is_latin_char(c) && c != '\'' && c != '-') {
      return false;
    }
  }
  return true;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() > suffix.size() && s.ends_with(suffix);
}

/// "stopp" -> "stop"
bool has_doubled_tail(std::string_view stem) {
  return stem.size() >= 2 && stem[stem.size() - 1] == stem[stem.size() - 2];
}

} // namespace

Dictionary::~Dictionary() = default;

bool Dictionary::hash_exists(std::uint64_t hash,
                             const std::vector<std::uint64_t> &hashes) noexcept {
  return std::binary_search(hashes.begin(), hashes.end(), hash);
}

void Dictionary::insert(std::string_view word) {
  const std::uint64_t h1 = Hasher::hash_folded(word);
  hashes_.push_back(h1);
  bloom_.add_hashes(h1, Hasher::derive_second(h1));
}

std::size_t Dictionary::load_word_list(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return 0;
  }

  const bool is_hunspell = std::string_view{path}.ends_with(".dic");

  std::string line;
  // First hunspell line is the entry count
  if (is_hunspell) {
    std::getline(file, line);
  }

  std::size_t count = 0;
  while (std::getline(file, line)) {
    std::string_view word = trim(line);
    if (is_hunspell) {
      word = trim(extract_word(word));
    }

    if (word.size() >= kDictMinWordLen && word.size() <= kDictMaxWordLen &&
        is_dictionary_word(word)) {
      insert(word);
      ++count;
    }
  }

  if (count > 0) {
    finalize_hashes();
    initialized_ = true;
  }
  return count;
}

bool Dictionary::initialize(const DictionaryConfig &config) {
  std::size_t total = 0;

#ifdef HAVE_HUNSPELL
  {
    std::ifstream test_aff(config.hunspell_aff);
    std::ifstream test_dic(config.hunspell_dic);
    if (test_aff.good() && test_dic.good()) {
      try {
        hunspell_ = std::make_unique<Hunspell>(
            config.hunspell_aff.c_str(), config.hunspell_dic.c_str());
        hunspell_available_ = true;
        std::cerr << "[wenjiao] Hunspell loaded: " << config.hunspell_dic
                  << "\n";
      } catch (const std::exception &e) {
        std::cerr << "[wenjiao] Hunspell init failed: " << e.what() << "\n";
      }
    }
  }
#endif

  if (config.word_lists.empty()) {
    for (const char *path : kDefaultWordLists) {
      std::size_t loaded = load_word_list(path);
      if (loaded > 0) {
        std::cerr << "[wenjiao] Loaded word list: " << path << " (+" << loaded
                  << " words)\n";
        total += loaded;
        break;
      }
    }
  } else {
    for (const auto &path : config.word_lists) {
      std::size_t loaded = load_word_list(path.string());
      if (loaded > 0) {
        std::cerr << "[wenjiao] Loaded word list: " << path.string() << " (+"
                  << loaded << " words)\n";
        total += loaded;
      } else {
        std::cerr << "[wenjiao] Word list unavailable: " << path.string()
                  << "\n";
      }
    }
  }

  for (const char *word : kBuiltinVocabulary) {
    insert(word);
  }
  finalize_hashes();

  // The built-in vocabulary alone is too small to judge spelling
  initialized_ = (total > 0 || hunspell_available_);

  std::cerr << "[wenjiao] Dictionary: " << hashes_.size()
            << " unique words, bloom fill "
            << static_cast<int>(bloom_.fill_ratio() * 100) << "%"
            << (hunspell_available_ ? ", hunspell on" : "") << "\n";

  return total > 0 || hunspell_available_;
}

void Dictionary::add_words(std::span<const std::string_view> words) {
  for (std::string_view word : words) {
    if (!word.empty()) {
      insert(word);
    }
  }
  finalize_hashes();
  initialized_ = true;
}

void Dictionary::finalize_hashes() {
  std::sort(hashes_.begin(), hashes_.end());
  hashes_.erase(std::unique(hashes_.begin(), hashes_.end()), hashes_.end());
}

bool Dictionary::contains_exact(std::string_view word) const noexcept {
  const std::uint64_t h1 = Hasher::hash_folded(word);
  if (!bloom_.maybe_contains_hashes(h1, Hasher::derive_second(h1))) {
    return false;
  }
  return hash_exists(h1, hashes_);
}

bool Dictionary::contains_stem(std::string_view word) const {
  const std::string lower = to_lower_ascii(word);
  const std::string_view w{lower};

  auto known = [this](std::string_view base) {
    return base.size() >= kDictMinWordLen && contains_exact(base);
  };
  auto known_with_e = [this](std::string_view base) {
    return contains_exact(std::string{base} + 'e');
  };

  // Plurals and third person
  if (ends_with(w, "ies") &&
      contains_exact(std::string{w.substr(0, w.size() - 3)} + 'y')) {
    return true;
  }
  if (ends_with(w, "es") && known(w.substr(0, w.size() - 2))) {
    return true;
  }
  if (ends_with(w, "s") && !w.ends_with("ss") && known(w.substr(0, w.size() - 1))) {
    return true;
  }

  // Past tense: related -> relate, stopped -> stop
  if (ends_with(w, "ed")) {
    std::string_view base = w.substr(0, w.size() - 2);
    if (known(base) || known_with_e(base)) {
      return true;
    }
    if (has_doubled_tail(base) && known(base.substr(0, base.size() - 1))) {
      return true;
    }
    if (base.ends_with('i') &&
        contains_exact(std::string{base.substr(0, base.size() - 1)} + 'y')) {
      return true;
    }
  }

  // Present participle: making -> make, running -> run
  if (ends_with(w, "ing")) {
    std::string_view base = w.substr(0, w.size() - 3);
    if (known(base) || known_with_e(base)) {
      return true;
    }
    if (has_doubled_tail(base) && known(base.substr(0, base.size() - 1))) {
      return true;
    }
  }

  // Adverbs, comparatives, superlatives, nominal suffixes
  for (std::string_view suffix : {"ly", "er", "est", "ment", "al"}) {
    if (ends_with(w, suffix) && known(w.substr(0, w.size() - suffix.size()))) {
      return true;
    }
  }

  // relation -> relate
  if (ends_with(w, "tion") &&
      contains_exact(std::string{w.substr(0, w.size() - 4)} + "te")) {
    return true;
  }

  // readable -> read, usable -> use, reliable -> rely
  for (std::string_view suffix : {"able", "ible"}) {
    if (!ends_with(w, suffix)) {
      continue;
    }
    std::string_view base = w.substr(0, w.size() - suffix.size());
    if (known(base) || known_with_e(base)) {
      return true;
    }
    if (base.ends_with('i') &&
        contains_exact(std::string{base.substr(0, base.size() - 1)} + 'y')) {
      return true;
    }
  }

  return false;
}

bool Dictionary::contains(std::string_view word) const {
  if (word.empty()) {
    return false;
  }
  if (contains_exact(word) || contains_stem(word)) {
    return true;
  }
  return spell(std::string{word});
}

bool Dictionary::spell(const std::string &word) const {
#ifdef HAVE_HUNSPELL
  if (hunspell_) {
    std::lock_guard lock(hunspell_mutex_);
    return hunspell_->spell(word) != 0;
  }
#else
  (void)word;
#endif
  return false;
}

std::vector<std::string> Dictionary::suggest(const std::string &word,
                                             std::size_t max_suggestions) const {
  std::vector<std::string> result;

#ifdef HAVE_HUNSPELL
  if (!hunspell_) {
    return result;
  }

  std::vector<std::string> suggestions;
  {
    std::lock_guard lock(hunspell_mutex_);
    suggestions = hunspell_->suggest(word);
  }

  std::size_t count = std::min(suggestions.size(), max_suggestions);
  result.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    result.push_back(std::move(suggestions[i]));
  }
#else
  (void)word;
  (void)max_suggestions;
#endif

  return result;
}

} // namespace wenjiao
