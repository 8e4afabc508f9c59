#include "toolshield/security/patterns.hpp"

#include <array>
#include <utility>

namespace toolshield::security {

const std::string FILTERED_PLACEHOLDER = "[FILTERED]";

namespace {

struct RuleSource {
  const char *label;
  const char *pattern;
  RunScanner scanner = nullptr;
};

// Injection and jailbreak rules open with \b so that a phrase buried inside another word
// ("impact as", "abundant") does not fire. std::regex recurses once per repeated character,
// so every repetition here is bounded: whitespace runs to 64, digit runs to 9.
const std::array<RuleSource, 22> kInjectionSources = {{
    {"ignore previous instructions",
     R"re(\bignore\s{1,64}(all\s{1,64}|any\s{1,64})?(your\s{1,64}|my\s{1,64})?(previous|prior|earlier|preceding)\s{1,64}(instructions|prompts|directives|context))re"},
    {"disregard instructions",
     R"re(\bdisregard\s{1,64}(all\s{1,64}|any\s{1,64})?(your\s{1,64}|my\s{1,64})?(prior\s{1,64}|previous\s{1,64}|earlier\s{1,64})?(instructions|prompts|directives|context))re"},
    {"new instructions", R"re(\b(your\s{1,64})?new\s{1,64}instructions(\s{1,64}are)?\s{0,64}:)re"},
    {"system prompt", R"re(\bsystem\s{1,64}prompt(\s{1,64}is)?\s{0,64}:)re"},
    {"you are now",
     R"re(\byou\s{1,64}are\s{1,64}(now|henceforth)(\s{1,64}acting\s{1,64}as)?\s{1,64}[\w\s"'-]{1,100})re"},
    {"do not follow previous",
     R"re(\bdo\s{1,64}not\s{1,64}(follow|obey|adhere\s{1,64}to)\s{1,64}(the\s{1,64})?(previous|prior|earlier)\s{1,64}(instructions|prompts))re"},
    {"forget instructions",
     R"re(\bforget\s{1,64}(all\s{1,64}|any\s{1,64})?(your\s{1,64}|my\s{1,64})?(previous|prior|earlier)?\s{0,64}(instructions|prompts|directives|context))re"},
    {"developer mode",
     R"re(\bentering\s{1,64}(developer|dev)\s{1,64}mode|\bdeveloper\s{1,64}mode\s{1,64}(enabled|activated))re"},
    {"instructions superseded",
     R"re(\b(instructions|prompts|directives)\s{1,64}(are|are\s{1,64}now)\s{1,64}(superceded|superseded|overridden|disregarded|replaced))re"},
    {"clear context",
     R"re(\bclear\s{1,64}(all\s{1,64})?((previous|prior)\s{1,64})?(context|instructions|history))re"},
    {"start fresh", R"re(\bstart\s{1,64}(fresh|anew|over))re"},
    {"reset instructions", R"re(\breset\s{1,64}(your\s{1,64})?instructions)re"},
    {"override instructions",
     R"re(\boverride\s{1,64}(all\s{1,64}|any\s{1,64})?(previous\s{1,64})?(instructions|prompts|context))re"},
    {"delete instructions",
     R"re(\bdelete\s{1,64}(all\s{1,64}|any\s{1,64})?(previous\s{1,64})?(instructions|prompts|context))re"},
    {"replace instructions",
     R"re(\breplace\s{1,64}(your\s{1,64})?(previous\s{1,64})?(instructions|prompts)\s{1,64}with)re"},
    {"instead of following",
     R"re(\binstead\s{1,64}of\s{1,64}(following|obeying)\s{1,64}(previous\s{1,64})?(instructions|prompts))re"},
    {"end session",
     R"re(\b(end|stop)\s{1,64}(the\s{1,64})?(previous\s{1,64})?(session|conversation|instructions))re"},
    {"simulate other system", R"re(\bsimulate\s{1,64}(a\s{1,64})?(different\s{1,64})?(ai|model|system)\b)re"},
    {"pretend other system",
     R"re(\bpretend\s{1,64}(to\s{1,64}be|you\s{1,64}are)\s{1,64}(a\s{1,64})?(different\s{1,64})?(ai|model|system)\b)re"},
    {"privileged mode", R"re(\benable\s{1,64}(admin|root|debug|developer)\s{1,64}mode)re"},
    {"unlock hidden features", R"re(\bunlock\s{1,64}(hidden|secret)\s{1,64}(features|capabilities|mode))re"},
    {"break character", R"re(\bbreak\s{1,64}out\s{1,64}of\s{1,64}(character|role))re"},
}};

const std::array<RuleSource, 24> kJailbreakSources = {{
    {"dan mode", R"re(\bDAN(\s{1,64}mode|\s{1,64}\d{1,9}(\.\d{1,9})?)?\b)re"},
    {"do anything now", R"re(\bdo\s{1,64}anything\s{1,64}now)re"},
    {"ignore restrictions",
     R"re(\bignore\s{1,64}(all\s{1,64})?(your\s{1,64})?(ethics|restrictions|limitations|safety\s{1,64}guidelines|filters|rules|programming))re"},
    {"act as",
     R"re(\bact\s{1,64}(?:[\w\s,.:;"'-]{0,50})?as(?:\s{1,64}if\s{1,64}you\s{1,64}were|\s{1,64}though\s{1,64}you\s{1,64}are|\s{1,64}like)?\s{1,64}[\w\s"'-]{1,100})re"},
    {"respond as",
     R"re(\brespond\s{1,64}(?:[\w\s,.:;"'-]{0,200}?)?as(?:\s{1,64}if\s{1,64}you\s{1,64}were|\s{1,64}though\s{1,64}you\s{1,64}are|\s{1,64}like)?\s{1,64}[\w\s"'-]{1,200})re"},
    {"hypothetically", R"re(\bhypothetically(\s{1,64}speaking)?\s{0,64},?)re"},
    {"bypass restrictions",
     R"re(\bbypass\s{1,64}(your|all|any)\s{1,64}(restrictions|filters|safety\s{1,64}protocols|programming))re"},
    {"unconstrained model", R"re(\bact\s{1,64}as\s{1,64}an\s{1,64}(unconstrained|unrestricted)\s{1,64}(model|ai))re"},
    {"refusal suppression",
     R"re(\b(if\s{1,64}you|when\s{1,64}you)\s{1,64}(would\s{1,64})?normally\s{1,64}(refuse|decline))re"},
    {"answer everything",
     R"re(\byou\s{1,64}(must|should|will)\s{1,64}answer\s{1,64}(every|all)\s{1,64}(questions?|prompts?))re"},
    {"stay in character", R"re(\bstay\s{1,64}in\s{1,64}character)re"},
    {"policy violation", R"re(\bgenerate\s{1,64}content\s{1,64}that\s{1,64}violates)re"},
    {"jailbreak mode", R"re(\bjailbreak\s{1,64}(mode|attempt))re"},
    {"malicious persona", R"re(\b(evil|bad|harmful)\s{1,64}(ai|assistant|model)\b)re"},
    {"no limits", R"re(\bno\s{1,64}(limits|restrictions|boundaries|filters))re"},
    {"anything goes", R"re(\banything\s{1,64}goes\s{1,64}(mode|now))re"},
    {"free thinking mode", R"re(\bfree\s{1,64}(will|thinking)\s{1,64}mode)re"},
    {"uncensored model", R"re(\buncensored\s{1,64}(ai|model|version)\b)re"},
    {"raw output mode", R"re(\braw\s{1,64}(output|response)\s{1,64}mode)re"},
    {"disable safety",
     R"re(\bdisable\s{1,64}(all\s{1,64})?(safety|ethical)\s{1,64}(checks|filters|protocols))re"},
    {"maximum freedom mode", R"re(\bmaximum\s{1,64}(freedom|creativity)\s{1,64}mode)re"},
    {"experimental mode", R"re(\bexperimental\s{1,64}(unrestricted\s{1,64})?mode)re"},
    {"roleplay as anyone", R"re(\b(roleplay|rp)\s{1,64}as\s{1,64}(anything|anyone))re"},
    {"ignore morals", R"re(\bignore\s{1,64}(moral|ethical)\s{1,64}(guidelines|principles))re"},
}};

bool is_ascii_alnum(const char c) {
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_hex_digit(const char c) {
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

bool is_decimal_digit(const char c) { return c >= '0' && c <= '9'; }

bool is_octal_digit(const char c) { return c >= '0' && c <= '7'; }

bool is_base64_char(const char c) { return is_ascii_alnum(c) || c == '+' || c == '/'; }

/// Number of consecutive bytes from `at` satisfying `pred`, counting no further than `limit`.
template <typename Pred>
std::size_t count_while(std::string_view text, std::size_t at, const std::size_t limit, Pred pred) {
  std::size_t count = 0;
  while (at < text.size() && count < limit && pred(text[at])) {
    ++at;
    ++count;
  }
  return count;
}

// A unit matcher returns the length of one unit starting at `at`, or 0.
using UnitMatcher = std::size_t (*)(std::string_view text, std::size_t at);

/// `\xHH`
std::size_t hex_escape_unit(std::string_view text, const std::size_t at) {
  if (text.substr(at, 2) != "\\x" || count_while(text, at + 2, 2, is_hex_digit) != 2) {
    return 0;
  }
  return 4;
}

/// `\uHHHH`
std::size_t unicode_escape_unit(std::string_view text, const std::size_t at) {
  if (text.substr(at, 2) != "\\u" || count_while(text, at + 2, 4, is_hex_digit) != 4) {
    return 0;
  }
  return 6;
}

/// `\` followed by one to three octal digits, longest first.
std::size_t octal_escape_unit(std::string_view text, const std::size_t at) {
  if (at >= text.size() || text[at] != '\\') {
    return 0;
  }
  const std::size_t digits = count_while(text, at + 1, 3, is_octal_digit);
  return digits == 0 ? 0 : digits + 1;
}

/// `%HH`
std::size_t url_escape_unit(std::string_view text, const std::size_t at) {
  if (at >= text.size() || text[at] != '%' || count_while(text, at + 1, 2, is_hex_digit) != 2) {
    return 0;
  }
  return 3;
}

/// `&#` or `&#x`, one to six digits, then `;`. Seven digits never match.
template <bool Hex> std::size_t numeric_entity_unit(std::string_view text, const std::size_t at) {
  const std::string_view opener = Hex ? "&#x" : "&#";
  if (text.substr(at, opener.size()) != opener) {
    return 0;
  }
  const std::size_t body = at + opener.size();
  const std::size_t digits =
      Hex ? count_while(text, body, 7, is_hex_digit) : count_while(text, body, 7, is_decimal_digit);
  if (digits == 0 || digits > 6 || body + digits >= text.size() || text[body + digits] != ';') {
    return 0;
  }
  return opener.size() + digits + 1;
}

/// `&name;` with at least two of `[#A-Za-z0-9]` between the delimiters.
std::size_t named_entity_unit(std::string_view text, const std::size_t at) {
  if (at >= text.size() || text[at] != '&') {
    return 0;
  }
  const std::size_t name = count_while(text, at + 1, text.size(), [](const char c) {
    return is_ascii_alnum(c) || c == '#';
  });
  const std::size_t close = at + 1 + name;
  if (name < 2 || close >= text.size() || text[close] != ';') {
    return 0;
  }
  return name + 2;
}

/// Leftmost position where `Unit` matches; with `Repeat`, adjacent units join one match.
template <UnitMatcher Unit, bool Repeat>
std::optional<MatchSpan> scan_units(std::string_view text, const std::size_t from) {
  for (std::size_t begin = from; begin < text.size(); ++begin) {
    std::size_t end = begin;
    for (std::size_t length = Unit(text, end); length != 0; length = Unit(text, end)) {
      end += length;
      if (!Repeat) {
        break;
      }
    }
    if (end != begin) {
      return MatchSpan{begin, end};
    }
  }
  return std::nullopt;
}

/// At least 20 base64 characters and up to two `=` of padding.
std::optional<MatchSpan> scan_base64(std::string_view text, const std::size_t from) {
  constexpr std::size_t kMinRun = 20;
  std::size_t index = from;
  while (index < text.size()) {
    const std::size_t run = count_while(text, index, text.size(), is_base64_char);
    if (run < kMinRun) {
      index += run == 0 ? 1 : run;
      continue;
    }
    const std::size_t padding =
        count_while(text, index + run, 2, [](const char c) { return c == '='; });
    return MatchSpan{index, index + run + padding};
  }
  return std::nullopt;
}

/// `$'...'` where `\\` and `\'` are escapes. Without an unescaped closing quote the match
/// ends at the last escaped one, as a backtracking matcher would settle.
std::optional<MatchSpan> scan_ansi_c_quote(std::string_view text, const std::size_t from) {
  for (auto begin = text.find("$'", from); begin != std::string_view::npos;
       begin = text.find("$'", begin + 1)) {
    auto last_escaped_quote = std::string_view::npos;
    std::size_t index = begin + 2;
    while (index < text.size()) {
      if (text[index] == '\\' && index + 1 < text.size() &&
          (text[index + 1] == '\\' || text[index + 1] == '\'')) {
        if (text[index + 1] == '\'') {
          last_escaped_quote = index + 1;
        }
        index += 2;
        continue;
      }
      if (text[index] == '\'') {
        return MatchSpan{begin, index + 1};
      }
      ++index;
    }
    if (last_escaped_quote != std::string_view::npos) {
      return MatchSpan{begin, last_escaped_quote + 1};
    }
  }
  return std::nullopt;
}

// Case-sensitive: these describe byte-level encodings, not phrasing. Rules whose repetition is
// unbounded are scanners; the regexes left here match a bounded number of bytes.
const std::array<RuleSource, 12> kEncodingSources = {{
    {"base64", nullptr, scan_base64},
    {"hex escape", nullptr, scan_units<hex_escape_unit, true>},
    {"unicode escape", nullptr, scan_units<unicode_escape_unit, true>},
    {"html entity", nullptr, scan_units<named_entity_unit, false>},
    {"octal escape", nullptr, scan_units<octal_escape_unit, true>},
    {"url encoding", nullptr, scan_units<url_escape_unit, true>},
    {"html decimal entity", nullptr, scan_units<numeric_entity_unit<false>, true>},
    {"html hex entity", nullptr, scan_units<numeric_entity_unit<true>, true>},
    {"ansi-c quoting", nullptr, scan_ansi_c_quote},
    {"escape sequence", R"re(\\[nrtbfav\\"'])re"},
    {"bare unicode escape", R"re(u[0-9A-Fa-f]{4})re"},
    {"extended unicode escape", R"re(U[0-9A-Fa-f]{8})re"},
}};

template <std::size_t N>
std::vector<DetectionRule> compile(const std::array<RuleSource, N> &sources,
                                   const RuleCategory category,
                                   const std::regex::flag_type flags) {
  std::vector<DetectionRule> rules;
  rules.reserve(N);
  for (const auto &source : sources) {
    DetectionRule rule{source.label, category, std::regex(), source.scanner, FILTERED_PLACEHOLDER};
    if (source.pattern != nullptr) {
      rule.regex = std::regex(source.pattern, flags);
    }
    rules.push_back(std::move(rule));
  }
  return rules;
}

} // namespace

std::string rule_category_label(const RuleCategory category) {
  switch (category) {
  case RuleCategory::Injection:
    return "prompt injection";
  case RuleCategory::Jailbreak:
    return "jailbreak";
  case RuleCategory::Encoding:
    return "encoding";
  }
  return "unknown";
}

const std::vector<DetectionRule> &detection_rules(const RuleCategory category) {
  static const std::vector<DetectionRule> injection =
      compile(kInjectionSources, RuleCategory::Injection, std::regex::ECMAScript | std::regex::icase);
  static const std::vector<DetectionRule> jailbreak =
      compile(kJailbreakSources, RuleCategory::Jailbreak, std::regex::ECMAScript | std::regex::icase);
  static const std::vector<DetectionRule> encoding =
      compile(kEncodingSources, RuleCategory::Encoding, std::regex::ECMAScript);

  switch (category) {
  case RuleCategory::Injection:
    return injection;
  case RuleCategory::Jailbreak:
    return jailbreak;
  case RuleCategory::Encoding:
    return encoding;
  }
  return encoding;
}

bool rule_matches(const DetectionRule &rule, const std::string &text) {
  if (rule.scanner != nullptr) {
    return rule.scanner(text, 0).has_value();
  }
  return std::regex_search(text, rule.regex);
}

std::string rule_replace(const DetectionRule &rule, const std::string &text) {
  if (rule.scanner == nullptr) {
    return std::regex_replace(text, rule.regex, rule.replacement);
  }
  std::string output;
  output.reserve(text.size());
  std::size_t copied = 0;
  for (auto match = rule.scanner(text, 0); match.has_value();
       match = rule.scanner(text, match->end)) {
    output.append(text, copied, match->begin - copied);
    output += rule.replacement;
    copied = match->end;
  }
  output.append(text, copied, std::string::npos);
  return output;
}

const std::unordered_map<std::uint32_t, char> &confusables_table() {
  static const std::unordered_map<std::uint32_t, char> table = {
      // Cyrillic
      {0x0430U, 'a'}, {0x0435U, 'e'}, {0x043EU, 'o'}, {0x0440U, 'p'}, {0x0441U, 'c'},
      {0x0445U, 'x'}, {0x0456U, 'i'}, {0x0455U, 's'}, {0x0458U, 'j'}, {0x04CFU, 'l'},
      {0x0410U, 'A'}, {0x0412U, 'B'}, {0x0415U, 'E'}, {0x041AU, 'K'}, {0x041CU, 'M'},
      {0x041DU, 'H'}, {0x041EU, 'O'}, {0x0420U, 'P'}, {0x0421U, 'C'}, {0x0422U, 'T'},
      {0x0425U, 'X'}, {0x0406U, 'I'}, {0x0405U, 'S'}, {0x0408U, 'J'},
      // Greek
      {0x03B1U, 'a'}, {0x03B5U, 'e'}, {0x03BFU, 'o'}, {0x03C1U, 'p'}, {0x03F2U, 'c'},
      {0x03C7U, 'x'},
      // Accented Latin
      {0x00E0U, 'a'}, {0x00E1U, 'a'}, {0x00E2U, 'a'}, {0x00E3U, 'a'}, {0x00E4U, 'a'},
      {0x00E5U, 'a'}, {0x00E7U, 'c'}, {0x00E8U, 'e'}, {0x00E9U, 'e'}, {0x00EAU, 'e'},
      {0x00EBU, 'e'}, {0x00F0U, 'd'}, {0x00F1U, 'n'}, {0x00F2U, 'o'}, {0x00F3U, 'o'},
      {0x00F4U, 'o'}, {0x00F5U, 'o'}, {0x00F6U, 'o'}, {0x00F9U, 'u'}, {0x00FAU, 'u'},
      {0x00FBU, 'u'}, {0x00FCU, 'u'}, {0x00FDU, 'y'}, {0x00FFU, 'y'},
      // Small capitals and IPA letters
      {0x1D00U, 'a'}, {0x1D07U, 'e'}, {0x1D0FU, 'o'}, {0x1D18U, 'p'}, {0x1D04U, 'c'},
      {0x0251U, 'a'}, {0x0252U, 'a'}, {0x025BU, 'e'}, {0x025CU, 'e'}, {0x026FU, 'o'},
      {0x0254U, 'o'}, {0x0279U, 'r'}, {0x0280U, 'r'},
      // Fullwidth vowels (NFKC folds these too; kept for callers that skip it)
      {0xFF41U, 'a'}, {0xFF45U, 'e'}, {0xFF49U, 'i'}, {0xFF4FU, 'o'}, {0xFF55U, 'u'},
  };
  return table;
}

bool is_problem_character(const std::uint32_t codepoint) {
  switch (codepoint) {
  // zero width
  case 0x200BU:
  case 0x200CU:
  case 0x200DU:
  case 0x2060U:
  case 0xFEFFU:
  // bidi controls
  case 0x202AU:
  case 0x202BU:
  case 0x202CU:
  case 0x202DU:
  case 0x202EU:
  case 0x061CU:
  // Hangul fillers
  case 0x115FU:
  case 0x1160U:
  case 0x3164U:
  case 0xFFA0U:
  // deprecated format characters
  case 0x206AU:
  case 0x206BU:
  case 0x206CU:
  case 0x206DU:
  case 0x206EU:
  case 0x206FU:
    return true;
  default:
    return false;
  }
}

} // namespace toolshield::security
