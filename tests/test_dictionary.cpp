#include "test_support.hpp"

#include "wenjiao/dictionary.hpp"
#include "wenjiao/engine.hpp"
#include "wenjiao/rule_set.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using namespace wenjiao;
namespace fs = std::filesystem;

fs::path write_temp(const std::string &name, const std::string &content) {
  fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

void test_add_words_and_lookup() {
  Dictionary dict;
  CHECK(!dict.is_ready());

  const std::vector<std::string_view> words = {"model", "study", "run",
                                               "relate", "walk"};
  dict.add_words(words);

  CHECK(dict.is_ready());
  CHECK(dict.size() == 5);
  CHECK(dict.contains("model"));
  CHECK(dict.contains("Model"));
  CHECK(dict.contains("MODEL"));
  CHECK(!dict.contains("machien"));
  CHECK(!dict.contains(""));
  CHECK(dict.bloom_fill() > 0.0);
}

void test_stem_matching() {
  Dictionary dict;
  const std::vector<std::string_view> words = {"model", "study", "run",
                                               "relate", "walk", "read"};
  dict.add_words(words);

  CHECK(dict.contains("models"));
  CHECK(dict.contains("studies"));
  CHECK(dict.contains("studied"));
  CHECK(dict.contains("walked"));
  CHECK(dict.contains("walking"));
  CHECK(dict.contains("running"));
  CHECK(dict.contains("related"));
  CHECK(dict.contains("relation"));
  CHECK(dict.contains("readable"));

  // "ss" is not a plural
  CHECK(!dict.contains("modelss"));
}

void test_load_word_lists() {
  const fs::path plain = write_temp("wenjiao_words.txt",
                                    "alpha\nbeta\n# not-a-word!\n\ngamma\n");
  const fs::path hunspell =
      write_temp("wenjiao_words.dic", "3\ndelta/S\nepsilon/MS\nzeta\n");

  Dictionary dict;
  CHECK(dict.load_word_list(plain.string()) == 3);
  CHECK(dict.load_word_list(hunspell.string()) == 3);
  CHECK(dict.load_word_list("/nonexistent/wenjiao/words.txt") == 0);

  CHECK(dict.is_ready());
  CHECK(dict.contains("alpha"));
  CHECK(dict.contains("gamma"));
  CHECK(dict.contains("delta"));
  CHECK(dict.contains("epsilon"));
  CHECK(!dict.contains("3"));

  fs::remove(plain);
  fs::remove(hunspell);
}

void test_initialize_with_configured_list() {
  const fs::path list = write_temp("wenjiao_init.txt", "wenjiaoword\n");

  DictionaryConfig config;
  config.word_lists = {list};
  config.hunspell_aff = "/nonexistent/en_US.aff";
  config.hunspell_dic = "/nonexistent/en_US.dic";

  Dictionary dict;
  CHECK(dict.initialize(config));
  CHECK(dict.contains("wenjiaoword"));
  // Built-in vocabulary is always present
  CHECK(dict.contains("the"));
  CHECK(dict.contains("research"));
  CHECK(!dict.is_hunspell_available());
  CHECK(dict.suggest("machien").empty());

  fs::remove(list);
}

void test_missing_lists_disable_spelling() {
  Config config;
  config.dictionary.word_lists = {"/nonexistent/wenjiao/words.txt"};
  config.dictionary.hunspell_aff = "/nonexistent/en_US.aff";
  config.dictionary.hunspell_dic = "/nonexistent/en_US.dic";

  Dictionary dict;
  CHECK(!dict.initialize(config.dictionary));
  CHECK(!dict.is_ready());
  // Built-in words still answer lookups
  CHECK(dict.contains("the"));

  Engine engine(config);
  CHECK(!engine.dictionary().is_ready());
  auto result =
      engine.analyze_text("we ran a quick check on every sentence here");
  for (const auto &issue : result.issues) {
    CHECK(issue.issue_type != "spelling");
  }
}

void test_rule_set_tables() {
  RuleSet rules = RuleSet::builtin();

  CHECK(rules.typo_count() > 0);
  CHECK(rules.typo_correction("teh") == std::optional<std::string_view>{"the"});
  CHECK(rules.typo_correction("Teh").has_value());
  CHECK(rules.typo_correction("machien") ==
        std::optional<std::string_view>{"machine"});
  CHECK(!rules.typo_correction("machine").has_value());

  CHECK(rules.title_typo_correction("reseach") ==
        std::optional<std::string_view>{"Research"});

  CHECK(rules.takes_a("university"));
  CHECK(rules.takes_a("european"));
  CHECK(!rules.takes_a("apple"));
  CHECK(rules.takes_an("hour"));
  CHECK(rules.takes_an("honest"));

  CHECK(rules.is_repeat_allowed("had"));
  CHECK(!rules.is_repeat_allowed("the"));
  CHECK(rules.is_reduplication_allowed(U'常'));
  CHECK(!rules.is_reduplication_allowed(U'我'));

  CHECK(!rules.phrase_rules().empty());
  CHECK(!rules.paired_rules().empty());
  CHECK(!rules.particle_rules().empty());
  CHECK(!rules.casual_title_phrases().empty());
}

void test_typo_file() {
  const fs::path table = write_temp(
      "wenjiao_typos.tsv",
      "# custom table\nmodle\tmodel\nrecieve receive\nsame same\nbroken\n");

  RuleSet rules;
  auto added = rules.load_typo_file(table);
  CHECK(added.has_value());
  CHECK(rules.typo_correction("modle") ==
        std::optional<std::string_view>{"model"});
  CHECK(rules.typo_correction("Recieve").has_value());
  // Identity pairs are never stored
  CHECK(!rules.typo_correction("same").has_value());
  CHECK(!rules.typo_correction("broken").has_value());

  CHECK(!rules.load_typo_file("/nonexistent/wenjiao/typos.tsv").has_value());

  fs::remove(table);
}

} // namespace

int main() {
  test_add_words_and_lookup();
  test_stem_matching();
  test_load_word_lists();
  test_initialize_with_configured_list();
  test_missing_lists_disable_spelling();
  test_rule_set_tables();
  test_typo_file();
  return 0;
}
