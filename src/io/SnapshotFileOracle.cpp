/* @file SnapshotFileOracle.cpp
 * @brief JSON state file probes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>

// third-party headers
#include <nlohmann/json.hpp>

// radflow headers
#include "core/Logger.hpp"
#include "io/SnapshotFileOracle.hpp"

using nlohmann::json;
using namespace radflow::io;

namespace {

  std::optional<bool> optionalBool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean())
      return std::nullopt;
    return it->get<bool>();
  }

  std::string stringOr(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return {};
    return it->get<std::string>();
  }

} // namespace

SnapshotFileOracle::SnapshotFileOracle(std::string path, core::Logger& log)
    : path_(std::move(path)), log_(log) {}

std::optional<json> SnapshotFileOracle::read() {
  std::ifstream in(path_);
  if (!in.good()) {
    if (!warned_.exchange(true))
      log_.warn("Oracle", "state file " + path_ + " not readable");
    return std::nullopt;
  }
  json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) {
    log_.trace("Oracle", "state file " + path_ + " malformed");
    return std::nullopt;
  }
  warned_.store(false);
  return doc;
}

std::optional<bool> SnapshotFileOracle::probeRecordingActive() {
  auto doc = read();
  if (!doc)
    return std::nullopt;
  return optionalBool(*doc, "recording");
}

std::optional<CaseSnapshot> SnapshotFileOracle::parseCase(const json& doc) {
  auto it = doc.find("case");
  if (it == doc.end() || !it->is_object())
    return std::nullopt;
  const json& c = *it;
  CaseSnapshot snap;
  snap.accession = stringOr(c, "accession");
  snap.reportText = stringOr(c, "report_text");
  snap.drafted = optionalBool(c, "drafted").value_or(false);
  snap.templateName = stringOr(c, "template_name");
  snap.description = stringOr(c, "description");
  snap.patientGender = stringOr(c, "patient_gender");
  return snap;
}

std::optional<CaseSnapshot> SnapshotFileOracle::probeCaseSnapshot() {
  auto doc = read();
  if (!doc)
    return std::nullopt;
  try {
    return parseCase(*doc);
  } catch (const json::exception& e) {
    log_.warn("Oracle", std::string("bad case object: ") + e.what());
    return std::nullopt;
  }
}

std::optional<bool> SnapshotFileOracle::probeDiscardDialogVisible() {
  auto doc = read();
  if (!doc)
    return std::nullopt;
  return optionalBool(*doc, "discard_dialog_visible");
}

std::optional<bool> SnapshotFileOracle::probeProtocolFlag(const std::string& accession) {
  auto doc = read();
  if (!doc)
    return std::nullopt;
  auto it = doc->find("protocol_flags");
  if (it == doc->end() || !it->is_object())
    return std::nullopt;
  return optionalBool(*it, accession.c_str());
}
