/* @file ReportText.cpp
 * @brief section extraction and consistency checks on report text
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <iterator>

// radflow headers
#include "report/ReportText.hpp"

namespace radflow::report {

  namespace {

    constexpr std::string_view kSectionHeaders[] = {
      "TECHNIQUE", "FINDINGS",       "CLINICAL HISTORY", "COMPARISON",
      "EXAM",      "PROCEDURE",      "INDICATION",       "CONCLUSION",
      "RECOMMENDATION", "SIGNATURE", "ELECTRONICALLY SIGNED"
    };

    constexpr std::string_view kBodyParts[] = {
      "HEAD",  "BRAIN",   "NECK",      "CERVICAL",   "C-SPINE",   "CSPINE",   "CHEST",
      "THORAX", "THORACIC", "T-SPINE", "TSPINE",     "LUNG",      "ABDOMEN",  "ABDOMINAL",
      "PELVIS", "PELVIC", "LUMBAR",    "L-SPINE",    "LSPINE",    "SPINE",    "EXTREMITY",
      "UPPER EXTREMITY", "LOWER EXTREMITY", "ARM",   "LEG",       "SHOULDER", "HIP",
      "KNEE",  "ANKLE",   "WRIST",     "ELBOW",      "FOOT",      "HAND",     "FINGER",
      "TOE",   "CARDIAC", "HEART",     "CORONARY",   "CTA",       "MRA",      "ANGIOGRAPHY",
      "ANGIOGRAM", "VENOGRAM", "PULMONARY VEINS", "PULMONARY ARTERIES", "PULMONARY EMBOLISM",
      "PE PROTOCOL", "AORTA", "AORTIC", "RUNOFF",    "CAROTID",   "SINUS",    "ORBIT",
      "FACE",  "FACIAL",  "MAXILLOFACIAL", "TEMPORAL", "IAC",     "RENAL",    "KIDNEY",
      "UROGRAM", "ENTEROGRAPHY", "LIVER", "PANCREAS"
    };

    constexpr std::string_view kFemaleOnlyTerms[] = {
      "UTERUS", "UTERINE", "OVARY", "OVARIES", "OVARIAN", "ENDOMETRI",
      "FALLOPIAN", "VAGINA", "PREGNAN"
    };

    constexpr std::string_view kMaleOnlyTerms[] = {
      "PROSTATE", "PROSTATIC", "TESTIS",  "TESTES",        "TESTICLE", "TESTICULAR",
      "SCROTUM",  "SCROTAL",   "SEMINAL VESICLE", "PENIS", "PENILE"
    };

    constexpr std::string_view kProtocolKeywords[] = {
      "STROKE",   "CVA",       "TIA",          "HEMIPARESIS",     "HEMIPLEGIA",
      "APHASIA",  "DYSARTHRIA", "FACIAL DROOP", "WEAKNESS",       "NUMBNESS",
      "CODE STROKE", "NIH STROKE SCALE", "NIHSS"
    };

    bool isWordChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

    /// Whole-word search so "TIA" does not fire inside "INITIAL".
    bool containsWord(const std::string& upper, std::string_view word) {
      std::size_t pos = 0;
      while ((pos = upper.find(word, pos)) != std::string::npos) {
        bool startOk = pos == 0 || !isWordChar(upper[pos - 1]);
        std::size_t end = pos + word.size();
        bool endOk = end >= upper.size() || !isWordChar(upper[end]);
        if (startOk && endOk)
          return true;
        ++pos;
      }
      return false;
    }

    std::string collapseWhitespace(std::string_view text) {
      std::string out;
      out.reserve(text.size());
      bool pendingSpace = false;
      for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
          pendingSpace = !out.empty();
          continue;
        }
        if (pendingSpace)
          out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
      }
      return out;
    }

    /// Drops control characters and non-breaking spaces left over from scraping.
    std::string cleanText(std::string_view text) {
      std::string out;
      out.reserve(text.size());
      for (std::size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0xC2 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xA0) {
          out.push_back(' ');
          ++i;
          continue;
        }
        if (c < 0x20 && c != '\n')
          continue;
        out.push_back(static_cast<char>(c));
      }
      return out;
    }

    /// Line break before "2.", "3.", ... when the text is a numbered list; "2.5 cm" is left alone.
    std::string formatNumberedItems(const std::string& text) {
      if (text.rfind("1.", 0) != 0)
        return text;
      std::string out;
      out.reserve(text.size() + 8);
      int expected = 1;
      std::size_t i = 0;
      while (i < text.size()) {
        const std::string marker = std::to_string(expected) + ".";
        if (text.compare(i, marker.size(), marker) == 0) {
          std::size_t after = i + marker.size();
          bool valid = after >= text.size() ||
                       std::isspace(static_cast<unsigned char>(text[after])) ||
                       std::isalpha(static_cast<unsigned char>(text[after]));
          bool boundary = i == 0 || text[i - 1] == ' ';
          if (valid && boundary) {
            if (expected > 1) {
              if (!out.empty() && out.back() == ' ')
                out.pop_back();
              out.push_back('\n');
            }
            out += marker;
            i = after;
            ++expected;
            continue;
          }
        }
        out.push_back(text[i]);
        ++i;
      }
      return out;
    }

    /// Position just past "<header>" followed by optional ':' / whitespace, or npos.
    std::size_t findHeader(const std::string& upper, std::string_view header) {
      std::size_t pos = upper.find(header);
      if (pos == std::string::npos)
        return pos;
      std::size_t i = pos + header.size();
      while (i < upper.size() && (upper[i] == ':' || upper[i] == ' ' || upper[i] == '\t' ||
                                  upper[i] == '\r' || upper[i] == '\n'))
        ++i;
      return i;
    }

    /// Start of the next line that opens with a known header followed by ':' or newline.
    std::size_t findNextSection(const std::string& upper, std::size_t from) {
      std::size_t line = upper.find('\n', from);
      while (line != std::string::npos) {
        std::size_t i = line + 1;
        while (i < upper.size() && (upper[i] == ' ' || upper[i] == '\t' || upper[i] == '\r'))
          ++i;
        for (auto header : kSectionHeaders) {
          if (upper.compare(i, header.size(), header) != 0)
            continue;
          std::size_t j = i + header.size();
          while (j < upper.size() && (upper[j] == ' ' || upper[j] == '\t'))
            ++j;
          if (j >= upper.size() || upper[j] == ':' || upper[j] == '\n' || upper[j] == '\r')
            return line;
        }
        line = upper.find('\n', line + 1);
      }
      return upper.size();
    }

    std::string sectionBody(std::string_view report, std::string_view header) {
      const std::string upper = toUpper(report);
      std::size_t start = findHeader(upper, header);
      if (start == std::string::npos || start >= upper.size())
        return {};
      // back up one so a header that ends the line is seen by findNextSection
      std::size_t end = findNextSection(upper, start > 0 ? start - 1 : start);
      if (end <= start)
        return {};
      return collapseWhitespace(report.substr(start, end - start));
    }

  } // namespace

  std::string toUpper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
  }

  std::string extractImpression(std::string_view report) {
    std::string body = sectionBody(report, "IMPRESSION");
    if (body.empty())
      return body;
    return formatNumberedItems(cleanText(body));
  }

  std::string extractClinicalHistory(std::string_view report) {
    return cleanText(sectionBody(report, "CLINICAL HISTORY"));
  }

  std::string extractTemplateName(std::string_view report) {
    const std::string upper = toUpper(report);
    std::size_t pos = upper.find("EXAM:");
    if (pos == std::string::npos)
      return {};
    std::size_t i = pos + 5;
    // same line first, then the following non-empty line
    while (i < report.size()) {
      std::size_t eol = report.find('\n', i);
      if (eol == std::string_view::npos)
        eol = report.size();
      std::string line = collapseWhitespace(report.substr(i, eol - i));
      if (!line.empty())
        return line;
      i = eol + 1;
    }
    return {};
  }

  bool hasCompleteMarker(std::string_view report) { return !extractImpression(report).empty(); }

  bool hasClinicalHistory(std::string_view report) {
    return toUpper(report).find("CLINICAL HISTORY") != std::string::npos;
  }

  std::size_t countLines(std::string_view text) {
    if (text.empty())
      return 0;
    std::size_t n = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    return text.back() == '\n' ? n : n + 1;
  }

  std::set<std::string> extractBodyParts(std::string_view text) {
    std::set<std::string> parts;
    const std::string upper = toUpper(text);
    if (upper.find_first_not_of(" \t\r\n") == std::string::npos)
      return parts;

    if (upper.find("CT ANGIO") != std::string::npos)
      parts.insert("CTA");
    if (upper.find("MR ANGIO") != std::string::npos)
      parts.insert("MRA");

    for (auto part : kBodyParts) {
      if (upper.find(part) == std::string::npos)
        continue;
      std::string_view normalized = part;
      if (part == "ABDOMINAL")
        normalized = "ABDOMEN";
      else if (part == "PELVIC")
        normalized = "PELVIS";
      else if (part == "C-SPINE" || part == "CSPINE")
        normalized = "CERVICAL";
      else if (part == "T-SPINE" || part == "TSPINE")
        normalized = "THORACIC";
      else if (part == "L-SPINE" || part == "LSPINE")
        normalized = "LUMBAR";
      else if (part == "THORAX" || part == "LUNG")
        normalized = "CHEST";
      else if (part == "BRAIN")
        normalized = "HEAD";
      else if (part == "ANGIOGRAPHY" || part == "ANGIOGRAM")
        normalized = "CTA";
      else if (part == "AORTIC")
        normalized = "AORTA";
      else if (part == "FACIAL" || part == "MAXILLOFACIAL")
        normalized = "FACE";
      parts.emplace(normalized);
    }
    return parts;
  }

  bool doBodyPartsMatch(std::string_view description, std::string_view templateName) {
    auto desc = extractBodyParts(description);
    auto tmpl = extractBodyParts(templateName);
    if (desc.empty() || tmpl.empty())
      return true;
    return desc == tmpl;
  }

  std::vector<std::string> checkGenderMismatch(std::string_view report,
                                               std::string_view patientGender) {
    std::vector<std::string> hits;
    const std::string gender = toUpper(patientGender);
    const bool male = gender == "MALE" || gender == "M";
    const bool female = gender == "FEMALE" || gender == "F";
    if (!male && !female)
      return hits;

    const std::string upper = toUpper(report);
    auto collect = [&](const auto& terms) {
      for (auto term : terms) {
        if (upper.find(term) != std::string::npos)
          hits.emplace_back(term);
      }
    };
    if (male)
      collect(kFemaleOnlyTerms);
    else
      collect(kMaleOnlyTerms);
    return hits;
  }

  bool containsProtocolKeywords(std::string_view text) {
    const std::string upper = toUpper(text);
    return std::any_of(std::begin(kProtocolKeywords), std::end(kProtocolKeywords),
                       [&](std::string_view k) { return containsWord(upper, k); });
  }

} // namespace radflow::report
