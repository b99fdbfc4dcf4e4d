/**
 * @file rule_set.cpp
 * @brief Built-in rule tables and typo file loader
 */

#include "wenjiao/rule_set.hpp"
#include "wenjiao/text_utils.hpp"
#include "wenjiao/types.hpp"

#include <fstream>

namespace wenjiao {

namespace {

struct TypoPair {
  const char *typo;
  const char *correction;
};

// clang-format off
constexpr TypoPair kCommonTypos[] = {
    {"teh", "the"}, {"wich", "which"}, {"shoudl", "should"},
    {"recieve", "receive"}, {"recieved", "received"}, {"wierd", "weird"},
    {"alot", "a lot"}, {"definately", "definitely"}, {"definitly", "definitely"},
    {"definate", "definite"}, {"seperate", "separate"}, {"occured", "occurred"},
    {"occurance", "occurrence"}, {"occurence", "occurrence"},
    {"ocurrance", "occurrence"}, {"accomodate", "accommodate"},
    {"adress", "address"}, {"advertisment", "advertisement"},
    {"agressive", "aggressive"}, {"apparant", "apparent"},
    {"appearence", "appearance"}, {"arguement", "argument"},
    {"assasination", "assassination"}, {"basicly", "basically"},
    {"begining", "beginning"}, {"beleive", "believe"}, {"belive", "believe"},
    {"buisness", "business"}, {"calender", "calendar"},
    {"catagory", "category"}, {"cemetary", "cemetery"},
    {"changable", "changeable"}, {"cheif", "chief"},
    {"collegue", "colleague"}, {"comming", "coming"},
    {"commitee", "committee"}, {"committe", "committee"},
    {"completly", "completely"}, {"concious", "conscious"},
    {"consious", "conscious"}, {"curiousity", "curiosity"},
    {"decieve", "deceive"}, {"dissapoint", "disappoint"},
    {"dissapear", "disappear"}, {"embarass", "embarrass"},
    {"enviroment", "environment"}, {"enviorment", "environment"},
    {"existance", "existence"}, {"experiance", "experience"},
    {"familliar", "familiar"}, {"familar", "familiar"}, {"finaly", "finally"},
    {"foriegn", "foreign"}, {"freind", "friend"}, {"goverment", "government"},
    {"gaurd", "guard"}, {"happend", "happened"}, {"harrass", "harass"},
    {"hieght", "height"}, {"immediatly", "immediately"},
    {"independant", "independent"}, {"interupt", "interrupt"},
    {"irrelevent", "irrelevant"}, {"knowlege", "knowledge"},
    {"liason", "liaison"}, {"libary", "library"}, {"lisence", "license"},
    {"maintainance", "maintenance"}, {"maintenence", "maintenance"},
    {"managment", "management"}, {"medecine", "medicine"},
    {"millenium", "millennium"}, {"miniscule", "minuscule"},
    {"mispell", "misspell"}, {"neccessary", "necessary"},
    {"necesary", "necessary"}, {"negociate", "negotiate"},
    {"nieghbor", "neighbor"}, {"noticable", "noticeable"},
    {"occassion", "occasion"}, {"occassionally", "occasionally"},
    {"oppurtunity", "opportunity"}, {"persistant", "persistent"},
    {"posession", "possession"}, {"prefered", "preferred"},
    {"presance", "presence"}, {"propoganda", "propaganda"},
    {"publically", "publicly"}, {"realy", "really"},
    {"reccomend", "recommend"}, {"recomend", "recommend"},
    {"refered", "referred"}, {"relevent", "relevant"},
    {"religous", "religious"}, {"remeber", "remember"},
    {"repitition", "repetition"}, {"rythm", "rhythm"},
    {"secratary", "secretary"}, {"sieze", "seize"}, {"similer", "similar"},
    {"sincerly", "sincerely"}, {"speach", "speech"},
    {"succesful", "successful"}, {"supercede", "supersede"},
    {"supress", "suppress"}, {"suprise", "surprise"},
    {"temperture", "temperature"}, {"tendancy", "tendency"},
    {"therefor", "therefore"}, {"threshhold", "threshold"},
    {"tommorrow", "tomorrow"}, {"tounge", "tongue"}, {"truely", "truly"},
    {"twelth", "twelfth"}, {"tyrany", "tyranny"}, {"untill", "until"},
    {"usally", "usually"}, {"vaccuum", "vacuum"}, {"vehical", "vehicle"},
    {"visable", "visible"}, {"wether", "whether"}, {"withold", "withhold"},
    {"writting", "writing"}, {"acheive", "achieve"}, {"aquire", "acquire"},
    {"equiped", "equipped"}, {"exagerate", "exaggerate"},
    {"excede", "exceed"}, {"heirarchy", "hierarchy"},
    {"hypocracy", "hypocrisy"}, {"incidently", "incidentally"},
    {"indispensible", "indispensable"}, {"intellegent", "intelligent"},
    {"judgement", "judgment"}, {"percieve", "perceive"},
    {"persue", "pursue"}, {"preceed", "precede"},
    {"predjudice", "prejudice"}, {"privelege", "privilege"},
    {"probly", "probably"}, {"probaly", "probably"},
    {"pronounciation", "pronunciation"}, {"quarentine", "quarantine"},
    {"questionaire", "questionnaire"}, {"readible", "readable"},
    {"referance", "reference"}, {"saftey", "safety"},
    {"shedule", "schedule"}, {"scedule", "schedule"},
    {"unforseen", "unforeseen"}, {"unfortunatly", "unfortunately"},
    {"whereever", "wherever"}, {"wellcome", "welcome"},

    // Academic vocabulary
    {"machien", "machine"}, {"academc", "academic"},
    {"achievment", "achievement"}, {"aquisition", "acquisition"},
    {"adminstration", "administration"}, {"aggreement", "agreement"},
    {"aproximate", "approximate"}, {"assesment", "assessment"},
    {"benifit", "benefit"}, {"challange", "challenge"},
    {"competetive", "competitive"}, {"concensus", "consensus"},
    {"contigency", "contingency"}, {"controversal", "controversial"},
    {"conveniance", "convenience"}, {"coorporation", "corporation"},
    {"criterias", "criteria"}, {"decison", "decision"},
    {"deficiet", "deficit"}, {"definiton", "definition"},
    {"disipline", "discipline"}, {"disscussion", "discussion"},
    {"ecconomic", "economic"}, {"emphsis", "emphasis"},
    {"equiptment", "equipment"}, {"excercise", "exercise"},
    {"explaination", "explanation"}, {"expresion", "expression"},
    {"faciliate", "facilitate"}, {"freqently", "frequently"},
    {"garantee", "guarantee"}, {"guidlines", "guidelines"},
    {"homogenous", "homogeneous"}, {"hipothesis", "hypothesis"},
    {"identiy", "identity"}, {"impliment", "implement"},
    {"inefficent", "inefficient"}, {"infered", "inferred"},
    {"influencial", "influential"}, {"inteligence", "intelligence"},
    {"intergrated", "integrated"}, {"interpretted", "interpreted"},
    {"manditory", "mandatory"}, {"mathmatics", "mathematics"},
    {"miscelaneous", "miscellaneous"}, {"negotation", "negotiation"},
    {"ommision", "omission"}, {"orignal", "original"},
    {"parrallel", "parallel"}, {"particpant", "participant"},
    {"personel", "personnel"}, {"phenomina", "phenomena"},
    {"potentialy", "potentially"}, {"practicle", "practical"},
    {"proffesional", "professional"}, {"prupose", "purpose"},
    {"psuedo", "pseudo"}, {"reconize", "recognize"},
    {"reluctent", "reluctant"}, {"specifc", "specific"},
    {"strenght", "strength"}, {"unuseual", "unusual"},
    {"analyis", "analysis"}, {"reseach", "research"},
    {"statisical", "statistical"}, {"significiant", "significant"},
    {"hypothsis", "hypothesis"}, {"methodolgy", "methodology"},
    {"framwork", "framework"}, {"implmentation", "implementation"},
    {"exprimental", "experimental"}, {"corelation", "correlation"},
    {"varibles", "variables"}, {"efficency", "efficiency"},
    {"optimzation", "optimization"}, {"algoritm", "algorithm"},
    {"proceedure", "procedure"}, {"comparision", "comparison"},
    {"improvment", "improvement"}, {"performace", "performance"},
    {"technolgoy", "technology"}, {"inovation", "innovation"},
    {"developement", "development"}, {"infomation", "information"},
    {"comunication", "communication"}, {"programing", "programming"},
    {"artifical", "artificial"}, {"intellgence", "intelligence"},
    {"efficent", "efficient"}, {"measurment", "measurement"},
    {"enhancment", "enhancement"},
};

// Misspellings typical of paper headings (matched only on heading lines)
constexpr TypoPair kTitleTypos[] = {
    {"Enronment", "Environment"}, {"Financal", "Financial"},
    {"Alocation", "Allocation"}, {"Empincal", "Empirical"},
    {"Eydence", "Evidence"}, {"Corporat", "Corporate"},
    {"Corprate", "Corporate"}, {"Geographc", "Geographic"},
    {"Busines", "Business"}, {"Endowmnt", "Endowment"},
    {"Analyis", "Analysis"}, {"Reseach", "Research"},
    {"Statisical", "Statistical"}, {"Significiant", "Significant"},
    {"Hypothsis", "Hypothesis"}, {"Methodolgy", "Methodology"},
    {"Framwork", "Framework"}, {"Implmentation", "Implementation"},
    {"Exprimental", "Experimental"}, {"Corelation", "Correlation"},
    {"Varibles", "Variables"}, {"Efficency", "Efficiency"},
    {"Optimzation", "Optimization"}, {"Algoritm", "Algorithm"},
    {"Proceedure", "Procedure"}, {"Comparision", "Comparison"},
    {"Improvment", "Improvement"}, {"Performace", "Performance"},
    {"Technolgoy", "Technology"}, {"Inovation", "Innovation"},
    {"Developement", "Development"}, {"Infomation", "Information"},
    {"Comunication", "Communication"}, {"Straegy", "Strategy"},
    {"Competitve", "Competitive"}, {"Advantge", "Advantage"},
    {"Sustainble", "Sustainable"}, {"Organiztion", "Organization"},
    {"Managment", "Management"}, {"Leadrship", "Leadership"},
    {"Enterprse", "Enterprise"}, {"Industy", "Industry"},
    {"Manufactring", "Manufacturing"}, {"Producton", "Production"},
    {"Distribtion", "Distribution"}, {"Consumtion", "Consumption"},
    {"Econmic", "Economic"}, {"Finacial", "Financial"},
    {"Investent", "Investment"}, {"Markting", "Marketing"},
    {"Advertsing", "Advertising"}, {"Behavor", "Behavior"},
    {"Psycholgy", "Psychology"}, {"Sociolgy", "Sociology"},
    {"Politcal", "Political"}, {"Governent", "Government"},
    {"Regultion", "Regulation"}, {"Legisltion", "Legislation"},
    {"Interntional", "International"}, {"Globl", "Global"},
    {"Reginal", "Regional"}, {"Natinal", "National"},
    {"Popultion", "Population"}, {"Demographc", "Demographic"},
    {"Environental", "Environmental"}, {"Sustainbility", "Sustainability"},
    {"Resouces", "Resources"}, {"Enery", "Energy"},
    {"Efficent", "Efficient"}, {"Renewble", "Renewable"},
    {"Polluton", "Pollution"}, {"Conservtion", "Conservation"},
    {"Biodivrsity", "Biodiversity"}, {"Ecosytem", "Ecosystem"},
    {"Climte", "Climate"}, {"Atmosphre", "Atmosphere"},
    {"Emisssions", "Emissions"}, {"Carbbon", "Carbon"},
    {"Footprnt", "Footprint"}, {"Digitl", "Digital"},
    {"Computr", "Computer"}, {"Softwre", "Software"},
    {"Hardwre", "Hardware"}, {"Netwrk", "Network"},
    {"Internnet", "Internet"}, {"Databse", "Database"},
    {"Programing", "Programming"}, {"Artifical", "Artificial"},
    {"Intellgence", "Intelligence"}, {"Machne", "Machine"},
    {"Learnng", "Learning"}, {"Robotcs", "Robotics"},
    {"Automtion", "Automation"}, {"Virtal", "Virtual"},
    {"Realiy", "Reality"}, {"Augmeted", "Augmented"},
    {"Simultion", "Simulation"}, {"Modelng", "Modeling"},
    {"Predicton", "Prediction"}, {"Forecsting", "Forecasting"},
    {"Effectveness", "Effectiveness"}, {"Productvity", "Productivity"},
    {"Qualiy", "Quality"}, {"Reliablity", "Reliability"},
    {"Validty", "Validity"}, {"Accurcy", "Accuracy"},
    {"Precison", "Precision"}, {"Measurment", "Measurement"},
    {"Evaluaton", "Evaluation"}, {"Assessent", "Assessment"},
    {"Synthsis", "Synthesis"}, {"Integrtion", "Integration"},
    {"Executon", "Execution"}, {"Operaton", "Operation"},
    {"Maintenace", "Maintenance"}, {"Enhancment", "Enhancement"},
    {"Maximiztion", "Maximization"}, {"Minimiztion", "Minimization"},
};
// clang-format on

struct PhraseSpec {
  const char *pattern;
  std::string_view issue_type;
  const char *message;
  const char *suggestion;
  bool latin;
};

// clang-format off
const PhraseSpec kPhraseRules[] = {
    // Redundant expressions
    {"事实上", issue_type::kRedundancy, "冗余表达: '事实上'", "可以直接陈述事实", false},
    {"总的来说", issue_type::kRedundancy, "冗余表达: '总的来说'", "可以省略", false},
    {"基本上", issue_type::kRedundancy, "冗余表达: '基本上'", "可以省略", false},
    {"实际上", issue_type::kRedundancy, "冗余表达: '实际上'", "可以直接陈述事实", false},
    {"从某种程度上讲", issue_type::kRedundancy, "冗余表达: '从某种程度上讲'", "可以更明确地表达", false},
    {"可以说是", issue_type::kRedundancy, "冗余表达: '可以说是'", "可以省略", false},
    {"in order to", issue_type::kRedundancy, "冗余表达: 'in order to'", "use 'to' instead", true},
    {"due to the fact that", issue_type::kRedundancy, "冗余表达: 'due to the fact that'", "use 'because' instead", true},
    {"in spite of the fact that", issue_type::kRedundancy, "冗余表达: 'in spite of the fact that'", "use 'although' instead", true},
    {"it is important to note that", issue_type::kRedundancy, "冗余表达: 'it is important to note that'", "omit this phrase", true},
    {"for all intents and purposes", issue_type::kRedundancy, "冗余表达: 'for all intents and purposes'", "use 'essentially' or omit", true},

    // Misused idioms
    {"一鸣惊动", issue_type::kIdiom, "成语使用错误: '一鸣惊动'", "应使用: '一鸣惊人'", false},
    {"不可思异", issue_type::kIdiom, "成语使用错误: '不可思异'", "应使用: '不可思议'", false},
    {"入木三寸", issue_type::kIdiom, "成语使用错误: '入木三寸'", "应使用: '入木三分'", false},
    {"文不加笔", issue_type::kIdiom, "成语使用错误: '文不加笔'", "应使用: '文不加点'", false},
    {"契而不舍", issue_type::kIdiom, "成语使用错误: '契而不舍'", "应使用: '锲而不舍'", false},
    {"首当其中", issue_type::kIdiom, "成语使用错误: '首当其中'", "应使用: '首当其冲'", false},
    {"无独有对", issue_type::kIdiom, "成语使用错误: '无独有对'", "应使用: '无独有偶'", false},
    {"鞭长莫逮", issue_type::kIdiom, "成语使用错误: '鞭长莫逮'", "应使用: '鞭长莫及'", false},
    {"本末颠倒", issue_type::kIdiom, "成语使用错误: '本末颠倒'", "应使用: '本末倒置'", false},
    {"刻船求剑", issue_type::kIdiom, "成语使用错误: '刻船求剑'", "应使用: '刻舟求剑'", false},

    // Informal style
    {"don't", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'do not'", true},
    {"can't", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'cannot'", true},
    {"won't", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'will not'", true},
    {"isn't", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'is not'", true},
    {"aren't", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'are not'", true},
    {"haven't", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'have not'", true},
    {"i'm", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'I am'", true},
    {"you're", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'you are'", true},
    {"it's", issue_type::kStyle, "学术写作中应避免使用缩写形式", "使用完整形式: 'it is'", true},
    {"很好", issue_type::kStyle, "非正式表达: '很好'", "考虑使用更正式的表达: '良好'", false},
    {"很大", issue_type::kStyle, "非正式表达: '很大'", "考虑使用更正式的表达: '巨大'", false},
    {"很小", issue_type::kStyle, "非正式表达: '很小'", "考虑使用更正式的表达: '微小'", false},
    {"很多", issue_type::kStyle, "非正式表达: '很多'", "考虑使用更正式的表达: '大量'", false},
    {"很少", issue_type::kStyle, "非正式表达: '很少'", "考虑使用更正式的表达: '稀少'", false},
    {"东西", issue_type::kStyle, "非正式表达: '东西'", "考虑使用更正式的表达: '物品'", false},

    // Prepositions and double negatives
    {"different to", issue_type::kGrammar, "介词用法不当: 'different to'", "建议使用: 'different from'", true},
    {"different than", issue_type::kGrammar, "介词用法不当: 'different than'", "建议使用: 'different from'", true},
    {"argue on", issue_type::kGrammar, "介词用法不当: 'argue on'", "建议使用: 'argue about'", true},
    {"arrive to", issue_type::kGrammar, "介词用法不当: 'arrive to'", "建议使用: 'arrive at/in'", true},
    {"in regards to", issue_type::kGrammar, "介词用法不当: 'in regards to'", "建议使用: 'regarding'", true},
    {"in the year of", issue_type::kGrammar, "介词用法不当: 'in the year of'", "建议使用: 'in the year'", true},
    {"regardless to", issue_type::kGrammar, "介词用法不当: 'regardless to'", "建议使用: 'regardless of'", true},
    {"similar than", issue_type::kGrammar, "介词用法不当: 'similar than'", "建议使用: 'similar to'", true},
    {"superior than", issue_type::kGrammar, "介词用法不当: 'superior than'", "建议使用: 'superior to'", true},
    {"don't have no", issue_type::kGrammar, "双重否定: 'don't have no'", "建议使用: 'don't have any'", true},
    {"can't hardly", issue_type::kGrammar, "双重否定: 'can't hardly'", "建议使用: 'can hardly'", true},
    {"won't be no", issue_type::kGrammar, "双重否定: 'won't be no'", "建议使用: 'won't be any'", true},
    {"didn't have no", issue_type::kGrammar, "双重否定: 'didn't have no'", "建议使用: 'didn't have any'", true},
    {"wouldn't never", issue_type::kGrammar, "双重否定: 'wouldn't never'", "建议使用: 'wouldn't ever'", true},
    {"couldn't barely", issue_type::kGrammar, "双重否定: 'couldn't barely'", "建议使用: 'could barely'", true},
};

const PhraseSpec kCasualTitlePhrases[] = {
    {"浅谈", issue_type::kTitleStyle, "标题中不宜使用口语化表达: '浅谈'", "使用更正式的学术表达，如'……研究'", false},
    {"浅议", issue_type::kTitleStyle, "标题中不宜使用口语化表达: '浅议'", "使用更正式的学术表达，如'……研究'", false},
    {"小议", issue_type::kTitleStyle, "标题中不宜使用口语化表达: '小议'", "使用更正式的学术表达，如'……研究'", false},
    {"漫谈", issue_type::kTitleStyle, "标题中不宜使用口语化表达: '漫谈'", "使用更正式的学术表达", false},
    {"杂谈", issue_type::kTitleStyle, "标题中不宜使用口语化表达: '杂谈'", "使用更正式的学术表达", false},
    {"一些", issue_type::kTitleStyle, "标题中不宜使用模糊表达: '一些'", "明确研究对象或范围", false},
    {"非常", issue_type::kTitleStyle, "标题中不宜使用程度副词: '非常'", "删除程度副词", false},
    {"很", issue_type::kTitleStyle, "标题中不宜使用程度副词: '很'", "删除程度副词", false},
    {"搞", issue_type::kTitleStyle, "标题中不宜使用口语化表达: '搞'", "使用'开展'或'进行'", false},
    {"some thoughts", issue_type::kTitleStyle, "标题中不宜使用口语化表达: 'some thoughts'", "state the research question directly", true},
    {"stuff", issue_type::kTitleStyle, "标题中不宜使用口语化表达: 'stuff'", "use a precise noun", true},
    {"things", issue_type::kTitleStyle, "标题中不宜使用口语化表达: 'things'", "use a precise noun", true},
    {"kind of", issue_type::kTitleStyle, "标题中不宜使用口语化表达: 'kind of'", "remove the hedge", true},
    {"sort of", issue_type::kTitleStyle, "标题中不宜使用口语化表达: 'sort of'", "remove the hedge", true},
    {"really", issue_type::kTitleStyle, "标题中不宜使用程度副词: 'really'", "remove the intensifier", true},
    {"very", issue_type::kTitleStyle, "标题中不宜使用程度副词: 'very'", "remove the intensifier", true},
    {"pretty", issue_type::kTitleStyle, "标题中不宜使用程度副词: 'pretty'", "remove the intensifier", true},
};
// clang-format on

// Reduplicated forms that are correct Chinese (AA adverbs, kinship terms)
constexpr std::u32string_view kReduplication =
    U"常渐慢刚往仅纷默人天个谢妈爸哥姐弟妹爷奶宝星轻悄匆稍偏明久处样家";

// Pronouns that never take the other number's verb form
constexpr std::string_view kSingularSubjects[] = {"it", "he", "she", "this"};
constexpr std::string_view kPluralVerbs[] = {"are", "were", "have", "do"};
constexpr std::string_view kPluralSubjects[] = {"they", "we", "these", "those"};
constexpr std::string_view kSingularVerbs[] = {"is", "was", "has", "does"};

} // namespace

RuleSet RuleSet::builtin() {
  RuleSet rules;

  for (const auto &[typo, correction] : kCommonTypos) {
    rules.add_typo(typo, correction);
  }
  for (const auto &[typo, correction] : kTitleTypos) {
    rules.title_typos_.emplace(to_lower_ascii(typo), correction);
  }

  for (const auto &entry : kPhraseRules) {
    rules.phrase_rules_.push_back({entry.pattern, std::string{entry.issue_type},
                                   entry.message, entry.suggestion, entry.latin});
  }
  for (const auto &entry : kCasualTitlePhrases) {
    rules.casual_title_phrases_.push_back({entry.pattern,
                                           std::string{entry.issue_type},
                                           entry.message, entry.suggestion,
                                           entry.latin});
  }

  // Paired connectives that duplicate each other's function
  rules.paired_rules_ = {
      {"虽然", "但是", std::string{issue_type::kGrammar},
       "建议使用: 虽然...但, 虽然和但是不应同时使用"},
      {"不仅没有", "也没有", std::string{issue_type::kGrammar},
       "建议使用: 不仅没有...而且没有, 搭配不当"},
  };

  // adjective + 的 + verb should use 地; verb + 地 + adjective should use 得
  rules.particle_rules_ = {
      {U"快慢高低大小好坏强弱深浅厚薄粗细长短宽窄", U'的',
       U"跑走看听说读写做想吃喝", U'地',
       "形容词后接动词应使用'地'而非'的'"},
      {U"跑走看听说读写做想吃喝", U'地',
       U"快慢高低大小好坏强弱深浅厚薄粗细长短宽窄", U'得',
       "动词后接形容词应使用'得'而非'地'"},
  };

  for (char32_t cp : kReduplication) {
    rules.reduplication_.insert(cp);
  }

  rules.repeat_allowed_ = {"had", "that"};

  for (std::string_view subject : kSingularSubjects) {
    for (std::string_view verb : kPluralVerbs) {
      rules.agreement_.emplace(std::string{subject} + ' ' + std::string{verb},
                               "'" + std::string{subject} +
                                   "' 后应使用单数动词形式");
    }
  }
  for (std::string_view subject : kPluralSubjects) {
    for (std::string_view verb : kSingularVerbs) {
      rules.agreement_.emplace(std::string{subject} + ' ' + std::string{verb},
                               "'" + std::string{subject} +
                                   "' 后应使用复数动词形式");
    }
  }

  rules.reference_labels_ = {"figure", "fig",     "table", "eq",
                             "equation", "section", "chapter", "step",
                             "appendix", "algorithm"};

  rules.a_prefixes_ = {"uni", "use", "usu", "usa", "uti", "eu", "one", "once",
                       "ubiq", "uran"};
  rules.an_prefixes_ = {"hour", "honest", "honor", "honour", "heir"};

  return rules;
}

void RuleSet::add_typo(std::string_view typo, std::string_view correction) {
  std::string key = to_lower_ascii(typo);
  if (key.empty() || key == to_lower_ascii(correction)) {
    return;
  }
  typos_[std::move(key)] = std::string{correction};
}

std::optional<std::size_t>
RuleSet::load_typo_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::size_t count = 0;
  std::string line;
  while (std::getline(file, line)) {
    std::string_view view = trim(line);
    if (view.empty() || view.front() == '#') {
      continue;
    }

    auto sep = view.find_first_of("\t ");
    if (sep == std::string_view::npos) {
      continue;
    }
    std::string_view typo = trim(view.substr(0, sep));
    std::string_view correction = trim(view.substr(sep + 1));
    if (typo.empty() || correction.empty()) {
      continue;
    }

    add_typo(typo, correction);
    ++count;
  }
  return count;
}

std::optional<std::string_view>
RuleSet::typo_correction(std::string_view word) const {
  auto it = typos_.find(to_lower_ascii(word));
  if (it == typos_.end()) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

std::optional<std::string_view>
RuleSet::title_typo_correction(std::string_view word) const {
  auto it = title_typos_.find(to_lower_ascii(word));
  if (it == title_typos_.end()) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

std::optional<std::string_view>
RuleSet::agreement_error(std::string_view subject, std::string_view verb) const {
  std::string key{subject};
  key += ' ';
  key.append(verb);
  auto it = agreement_.find(key);
  if (it == agreement_.end()) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

bool RuleSet::takes_a(std::string_view lower_word) const {
  for (const auto &prefix : a_prefixes_) {
    if (lower_word.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

bool RuleSet::takes_an(std::string_view lower_word) const {
  for (const auto &prefix : an_prefixes_) {
    if (lower_word.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

} // namespace wenjiao
