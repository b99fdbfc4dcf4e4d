#include "test_support.hpp"

#include "wenjiao/detectors.hpp"
#include "wenjiao/text_utils.hpp"

#include <string>

namespace {

using namespace wenjiao;
using wenjiao::test::make_analyzer;
using wenjiao::test::make_dictionary;
using wenjiao::test::of_type;
using wenjiao::test::quiet_config;

// ===========================================================================
// Spelling and typo table
// ===========================================================================

void test_spelling_flags_unknown_word() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("this simple sentence has a wrongg word");
  auto issues = of_type(result, issue_type::kSpelling);

  // "has" and "word" are unknown as well; only check "wrongg"
  bool found = false;
  for (const auto &issue : issues) {
    if (issue.message == "词典中未找到: 'wrongg'") {
      found = true;
      CHECK(issue.line_number == 1);
      CHECK(issue.start == 27);
      CHECK(issue.end == 33);
      CHECK(issue.suggestion == "请检查拼写是否正确");
    }
  }
  CHECK(found);
}

void test_spelling_uses_typo_table_suggestion() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  config.detectors.typo = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("the machien works");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].issue_type == "spelling");
  CHECK(result.issues[0].start == 4);
  CHECK(result.issues[0].end == 11);
  CHECK(result.issues[0].suggestion == "建议修改为: 'machine'");
}

void test_spelling_dedup_per_line() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  config.detectors.typo = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("machien and machien\nmachien");
  auto issues = of_type(result, issue_type::kSpelling);
  CHECK(issues.size() == 2);
  CHECK(issues[0].line_number == 1);
  CHECK(issues[0].start == 0);
  CHECK(issues[1].line_number == 2);
  CHECK(of_type(result, issue_type::kTypo).empty());
}

void test_case_insensitive_dedup() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  config.detectors.typo = true;
  auto analyzer = make_analyzer(config);

  // Case variants are one token: reported once, at the first occurrence
  auto result = analyzer->analyze("Machien machien");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].issue_type == "spelling");
  CHECK(result.issues[0].start == 0);
  CHECK(result.issues[0].end == 7);

  auto reversed = analyzer->analyze("recieve Recieve");
  CHECK(reversed.issues.size() == 1);
  CHECK(reversed.issues[0].start == 0);

  // Without a lowercase form on the line the capitalized word is a name
  auto name = analyzer->analyze("Machien works");
  CHECK(of_type(name, issue_type::kSpelling).empty());
}

void test_spelling_skips() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  auto analyzer = make_analyzer(config);

  // Proper nouns, hyphenated terms, contractions, digits
  auto result = analyzer->analyze("Zhangsan state-of-art model's don't abc123");
  CHECK(result.issues.empty());

  config.dictionary.skip_capitalized = false;
  auto strict = make_analyzer(config);
  auto flagged = strict->analyze("Zhangsan");
  CHECK(flagged.issues.size() == 1);
}

void test_typo_detector_alone() {
  Config config = quiet_config();
  config.detectors.typo = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("I recieve teh data, Teh end");
  auto issues = of_type(result, issue_type::kTypo);
  CHECK(issues.size() == 2);
  CHECK(issues[0].message == "可能的错别字: 'recieve'");
  CHECK(issues[0].suggestion == "建议修改为: 'receive'");
  CHECK(issues[1].start == 10);
  CHECK(issues[1].end == 13);
}

void test_chinese_text_not_flagged() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  config.detectors.typo = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("这是一个中文句子，没有任何英文。\n我们继续讨论这个问题");
  CHECK(result.issues.empty());
}

void test_mixed_line_flags_latin_typo() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  config.detectors.typo = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("本研究采用了machien learning方法");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].start == 6);
  CHECK(result.issues[0].end == 13);
}

void test_spelling_disabled_without_dictionary() {
  Config config = quiet_config();
  config.detectors.spelling = true;
  auto rules = std::make_shared<RuleSet>(RuleSet::builtin());
  auto registry =
      make_registry(config, std::make_shared<Dictionary>(), rules);
  CHECK(registry.empty());
}

// ===========================================================================
// Headings
// ===========================================================================

void test_title_line_detection() {
  CHECK(is_title_line("# 浅谈机器学习", 80));
  CHECK(is_title_line("1. Research Design", 80));
  CHECK(is_title_line("第一章 绪论", 80));
  CHECK(is_title_line("二、研究方法", 80));
  CHECK(is_title_line("Introduction", 80));
  CHECK(is_title_line("Deep Learning for Graph Data", 80));
  CHECK(!is_title_line("This is an ordinary sentence, with a comma.", 80));
  CHECK(!is_title_line("", 80));
  CHECK(!is_title_line("1. Research Design", 5));
}

void test_title_detector() {
  Config config = quiet_config();
  config.detectors.title = true;
  auto analyzer = make_analyzer(config);

  auto casual = analyzer->analyze("# 浅谈机器学习");
  CHECK(casual.issues.size() == 1);
  CHECK(casual.issues[0].issue_type == "title_style");
  CHECK(casual.issues[0].start == 2);
  CHECK(casual.issues[0].end == 4);

  auto stop = analyzer->analyze("Introduction.");
  CHECK(stop.issues.size() == 1);
  CHECK(stop.issues[0].message == "标题末尾不应使用句号");
  CHECK(stop.issues[0].start == 12);
  CHECK(stop.issues[0].end == 13);

  // Ordinary sentences are not headings
  auto body = analyzer->analyze("We show that the model works very well.");
  CHECK(body.issues.empty());

  // Trailing no-break space after the full stop
  auto nbsp = analyzer->analyze("# 结论。\u00A0");
  CHECK(nbsp.issues.size() == 1);
  CHECK(nbsp.issues[0].start == 4);
  CHECK(nbsp.issues[0].end == 5);

  // U+4E20 ends in the byte 0xA0 and is not whitespace
  auto cjk = analyzer->analyze("# 结论。丠");
  CHECK(cjk.issues.empty());
}

void test_title_typo_once_per_document() {
  Config config = quiet_config();
  config.detectors.title = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("1. Reseach Design\n2. Reseach Results");
  auto issues = of_type(result, issue_type::kTitleSpelling);
  CHECK(issues.size() == 1);
  CHECK(issues[0].line_number == 1);
  CHECK(issues[0].start == 3);
  CHECK(issues[0].end == 10);
  CHECK(issues[0].suggestion == "建议修改为: 'Research'");
}

// ===========================================================================
// Repeats
// ===========================================================================

void test_repeated_words() {
  Config config = quiet_config();
  config.detectors.repeated = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("the the model works");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].issue_type == "repeated_word");
  CHECK(result.issues[0].start == 0);
  CHECK(result.issues[0].end == 7);

  auto mixed_case = analyzer->analyze("We saw The the, THE result");
  CHECK(mixed_case.issues.size() == 1);
  CHECK(mixed_case.issues[0].start == 7);
  CHECK(mixed_case.issues[0].end == 19);

  CHECK(analyzer->analyze("he had had enough").issues.empty());
  CHECK(analyzer->analyze("page 10 10 again").issues.empty());
}

void test_repeated_chars() {
  Config config = quiet_config();
  config.detectors.repeated = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("我我认为这样做是对的");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].issue_type == "repeated_char");
  CHECK(result.issues[0].start == 0);
  CHECK(result.issues[0].end == 2);

  // Reduplicated adverbs are fine, longer runs are not
  CHECK(analyzer->analyze("他常常渐渐地明白了").issues.empty());
  auto triple = analyzer->analyze("常常常");
  CHECK(triple.issues.size() == 1);
  CHECK(triple.issues[0].end == 3);
}

// ===========================================================================
// Sentences and punctuation
// ===========================================================================

void test_sentence_length() {
  Config config = quiet_config();
  config.detectors.sentence = true;
  config.detectors.max_sentence_chars_zh = 10;
  config.detectors.max_sentence_chars_en = 20;
  auto analyzer = make_analyzer(config);

  auto zh = analyzer->analyze("这个句子显然超过了十个字的限制。短句。");
  CHECK(zh.issues.size() == 1);
  CHECK(zh.issues[0].issue_type == "sentence_length");
  CHECK(zh.issues[0].start == 0);
  CHECK(zh.issues[0].end == 16);
  CHECK(zh.issues[0].message == "句子过长 (16 字符)");

  // A decimal point does not end the sentence
  auto en = analyzer->analyze("Pi is 3.14 and e is 2.71 ok");
  CHECK(en.issues.size() == 1);
  CHECK(en.issues[0].message == "可能的长句 (27 字符)");

  CHECK(analyzer->analyze("Short one. Another.").issues.empty());
}

void test_punctuation_runs() {
  Config config = quiet_config();
  config.detectors.sentence = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("真的吗？？");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].issue_type == "punctuation");
  CHECK(result.issues[0].start == 3);
  CHECK(result.issues[0].end == 5);

  CHECK(analyzer->analyze("Wait... what").issues.empty());
  CHECK(analyzer->analyze("Tools, e.g., hammers").issues.empty());
  CHECK(analyzer->analyze("他说。。。然后").issues.empty());
  CHECK(analyzer->analyze("Really?!").issues.size() == 1);
}

void test_unmatched_bracket() {
  Config config = quiet_config();
  config.detectors.sentence = true;
  auto analyzer = make_analyzer(config);

  auto result = analyzer->analyze("这是（一个测试");
  CHECK(result.issues.size() == 1);
  CHECK(result.issues[0].message == "圆括号不配对");
  CHECK(result.issues[0].start == 2);
  CHECK(result.issues[0].end == 3);

  CHECK(analyzer->analyze("这是（一个）测试").issues.empty());
}

// ===========================================================================
// Phrase rules
// ===========================================================================

void test_phrase_rules() {
  Config config = quiet_config();
  config.detectors.phrase = true;
  auto analyzer = make_analyzer(config);

  auto redundancy = analyzer->analyze("In Order To win, we train");
  CHECK(redundancy.issues.size() == 1);
  CHECK(redundancy.issues[0].issue_type == "redundancy");
  CHECK(redundancy.issues[0].start == 0);
  CHECK(redundancy.issues[0].end == 11);

  // Whole words only
  CHECK(analyzer->analyze("the border to the north").issues.empty());

  auto idiom = analyzer->analyze("他的表现不可思异");
  CHECK(idiom.issues.size() == 1);
  CHECK(idiom.issues[0].issue_type == "idiom");
  CHECK(idiom.issues[0].start == 4);
  CHECK(idiom.issues[0].end == 8);
  CHECK(idiom.issues[0].suggestion == "应使用: '不可思议'");

  // First occurrence per line only
  auto twice = analyzer->analyze("首当其中，又是首当其中");
  CHECK(twice.issues.size() == 1);

  auto style = analyzer->analyze("We don't know");
  CHECK(style.issues.size() == 1);
  CHECK(style.issues[0].issue_type == "style");
}

void test_paired_and_particle_rules() {
  Config config = quiet_config();
  config.detectors.phrase = true;
  auto analyzer = make_analyzer(config);

  auto paired = analyzer->analyze("虽然下雨但是他来了");
  CHECK(paired.issues.size() == 1);
  CHECK(paired.issues[0].issue_type == "grammar");
  CHECK(paired.issues[0].start == 0);
  CHECK(paired.issues[0].end == 6);
  CHECK(paired.issues[0].message == "语序结构: 虽然下雨但是");

  auto particle = analyzer->analyze("他快的跑过去");
  CHECK(particle.issues.size() == 1);
  CHECK(particle.issues[0].start == 2);
  CHECK(particle.issues[0].end == 3);
  CHECK(particle.issues[0].suggestion == "将'的'改为'地'");

  auto de = analyzer->analyze("他跑地快");
  CHECK(de.issues.size() == 1);
  CHECK(de.issues[0].suggestion == "将'地'改为'得'");
}

// ===========================================================================
// Articles
// ===========================================================================

void test_articles() {
  Config config = quiet_config();
  config.detectors.article = true;
  auto analyzer = make_analyzer(config);

  auto apple = analyzer->analyze("I ate a apple");
  CHECK(apple.issues.size() == 1);
  CHECK(apple.issues[0].issue_type == "grammar");
  CHECK(apple.issues[0].start == 6);
  CHECK(apple.issues[0].end == 7);
  CHECK(apple.issues[0].suggestion == "将 'a' 改为 'an'");

  auto book = analyzer->analyze("Read an book. An book too.");
  CHECK(book.issues.size() == 2);
  CHECK(book.issues[0].suggestion == "将 'an' 改为 'a'");

  CHECK(analyzer->analyze("an hour and a university").issues.empty());
  CHECK(analyzer->analyze("an FBI agent and a FBI agent").issues.empty());
  CHECK(analyzer->analyze("Figure A shows an example").issues.empty());
  CHECK(analyzer->analyze("a, b and c").issues.empty());

  // A full-width full stop starts a new sentence
  auto after_cn = analyzer->analyze("结论如下。 A apple fell");
  CHECK(after_cn.issues.size() == 1);
  CHECK(after_cn.issues[0].start == 6);
  CHECK(after_cn.issues[0].end == 7);
}

// ===========================================================================
// Subject-verb agreement
// ===========================================================================

void test_agreement() {
  Config config = quiet_config();
  config.detectors.agreement = true;
  auto analyzer = make_analyzer(config);

  auto singular = analyzer->analyze("We think it are fine");
  CHECK(singular.issues.size() == 1);
  CHECK(singular.issues[0].issue_type == "grammar");
  CHECK(singular.issues[0].start == 9);
  CHECK(singular.issues[0].end == 15);
  CHECK(singular.issues[0].message == "主谓不一致: 'it are'");
  CHECK(singular.issues[0].suggestion == "'it' 后应使用单数动词形式");

  auto plural = analyzer->analyze("They is late. These was wrong.");
  CHECK(plural.issues.size() == 2);
  CHECK(plural.issues[0].start == 0);
  CHECK(plural.issues[0].end == 7);
  CHECK(plural.issues[0].suggestion == "'they' 后应使用复数动词形式");
  CHECK(plural.issues[1].start == 14);

  CHECK(analyzer->analyze("It is fine and they are late").issues.empty());
  CHECK(analyzer->analyze("Does it have a name?").issues.empty());
  CHECK(analyzer->analyze("the models that are used").issues.empty());
  CHECK(analyzer->analyze("for it, are we sure").issues.empty());
}

// ===========================================================================
// Citations
// ===========================================================================

void test_citation_mixed_styles() {
  Config config = quiet_config();
  config.detectors.citation = true;
  auto analyzer = make_analyzer(config);

  const std::string line = "as shown (Smith, 2020) and in [3].";
  auto mixed = analyzer->analyze(line);
  CHECK(mixed.issues.size() == 1);
  CHECK(mixed.issues[0].issue_type == "citation");
  CHECK(mixed.issues[0].start == 0);
  CHECK(mixed.issues[0].end == char_count(line));
  CHECK(mixed.issues[0].message == "同一行中存在不同的引用格式");

  CHECK(analyzer->analyze("(Smith 12) and [4]").issues.size() == 1);

  // One style per line is fine
  CHECK(analyzer->analyze("(Smith, 2020) and (Jones, 2019)").issues.empty());
  CHECK(analyzer->analyze("see [1] and [12]").issues.empty());
}

void test_citation_errors() {
  Config config = quiet_config();
  config.detectors.citation = true;
  auto analyzer = make_analyzer(config);

  auto comma = analyzer->analyze("see (Smith 2020) here");
  CHECK(comma.issues.size() == 1);
  CHECK(comma.issues[0].start == 4);
  CHECK(comma.issues[0].end == 16);
  CHECK(comma.issues[0].message == "引用格式可能缺少逗号");
  CHECK(comma.issues[0].suggestion == "例如：(Smith, 2020)");

  auto year = analyzer->analyze("according to (Smith)");
  CHECK(year.issues.size() == 1);
  CHECK(year.issues[0].start == 13);
  CHECK(year.issues[0].end == 20);
  CHECK(year.issues[0].message == "引用格式可能缺少年份");

  // Abbreviations, figure labels and lowercase asides are not citations
  CHECK(analyzer
            ->analyze("a neural network (CNN) in (Table 3), (Figure 2) and "
                      "(optional) [4]")
            .issues.empty());
}

// ===========================================================================
// Registry
// ===========================================================================

void test_registry_order() {
  Config config;
  auto rules = std::make_shared<RuleSet>(RuleSet::builtin());
  auto registry = make_registry(config, make_dictionary(), rules);

  CHECK(registry.size() == 9);
  CHECK(registry[0]->name() == "spelling");
  CHECK(registry[1]->name() == "typo");
  CHECK(registry[2]->name() == "title");
  CHECK(registry[3]->name() == "repeated");
  CHECK(registry[4]->name() == "sentence");
  CHECK(registry[5]->name() == "phrase");
  CHECK(registry[6]->name() == "article");
  CHECK(registry[7]->name() == "agreement");
  CHECK(registry[8]->name() == "citation");

  config.detectors.title = false;
  config.detectors.article = false;
  config.detectors.citation = false;
  CHECK(make_registry(config, make_dictionary(), rules).size() == 6);
}

} // namespace

int main() {
  test_spelling_flags_unknown_word();
  test_spelling_uses_typo_table_suggestion();
  test_spelling_dedup_per_line();
  test_case_insensitive_dedup();
  test_spelling_skips();
  test_typo_detector_alone();
  test_chinese_text_not_flagged();
  test_mixed_line_flags_latin_typo();
  test_spelling_disabled_without_dictionary();
  test_title_line_detection();
  test_title_detector();
  test_title_typo_once_per_document();
  test_repeated_words();
  test_repeated_chars();
  test_sentence_length();
  test_punctuation_runs();
  test_unmatched_bracket();
  test_phrase_rules();
  test_paired_and_particle_rules();
  test_articles();
  test_agreement();
  test_citation_mixed_styles();
  test_citation_errors();
  test_registry_order();
  return 0;
}
