#pragma once
/** @file  ReportText.hpp
 *  @brief Pure text helpers over scraped report content.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace radflow::report {

  /// Text of the IMPRESSION section up to the next known header, whitespace
  /// collapsed, numbered items on their own lines. Empty when absent.
  std::string extractImpression(std::string_view report);

  /// Text of the CLINICAL HISTORY section (whitespace collapsed), or empty.
  std::string extractClinicalHistory(std::string_view report);

  /// First non-empty line after "EXAM:", used when the template name is not scraped.
  std::string extractTemplateName(std::string_view report);

  /// True once the report carries a non-empty impression section.
  bool hasCompleteMarker(std::string_view report);

  /// True when the report contains a CLINICAL HISTORY header.
  bool hasClinicalHistory(std::string_view report);

  std::size_t countLines(std::string_view text);

  /// Normalized body parts mentioned in \p text (upper case, synonyms folded).
  std::set<std::string> extractBodyParts(std::string_view text);

  /// Set equality of normalized body parts; an undeterminable side counts as a match.
  bool doBodyPartsMatch(std::string_view description, std::string_view templateName);

  /// Sex-specific anatomy terms in \p report that contradict \p patientGender
  /// ("Male"/"Female", case-insensitive). Empty when consistent or unknown.
  std::vector<std::string> checkGenderMismatch(std::string_view report,
                                               std::string_view patientGender);

  /// Stroke-protocol keywords (case-insensitive) in \p text.
  bool containsProtocolKeywords(std::string_view text);

  std::string toUpper(std::string_view text);

} // namespace radflow::report
