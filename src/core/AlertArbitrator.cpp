/* @file AlertArbitrator.cpp
 * @brief priority selection + show/hide toggling of the alert surface
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/AlertArbitrator.hpp"
#include "io/Presentation.hpp"

using namespace radflow::core;

std::optional<Alert> AlertArbitrator::select(const AlertConditions& c) {
  if (c.genderMismatch)
    return Alert{ AlertKind::GenderMismatch, c.genderDetail };
  if (c.templateMismatch)
    return Alert{ AlertKind::TemplateMismatch, c.templateDetail };
  if (c.protocolFlag)
    return Alert{ AlertKind::ProtocolFlag, c.protocolDetail };
  return std::nullopt;
}

void AlertArbitrator::present(const AlertConditions& conditions, const Settings& settings,
                              io::Presentation& presentation) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!settings.showAlertSurface) {
    hide(presentation);
    return;
  }

  if (settings.alertMode == AlertMode::AlwaysShow) {
    shown_ = select(conditions);
    if (indicators_ && *indicators_ == conditions)
      return;
    presentation.setAlertIndicators(conditions);
    indicators_ = conditions;
    visible_ = true;
    return;
  }

  indicators_.reset();
  auto selected = select(conditions);
  if (!selected) {
    hide(presentation);
    return;
  }
  if (shown_ && *shown_ == *selected && visible_)
    return;
  presentation.showAlert(*selected);
  shown_ = std::move(selected);
  visible_ = true;
}

void AlertArbitrator::reset(io::Presentation& presentation) {
  std::lock_guard<std::mutex> lock(mtx_);
  hide(presentation);
}

std::optional<Alert> AlertArbitrator::shown() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return shown_;
}

void AlertArbitrator::hide(io::Presentation& presentation) {
  if (visible_)
    presentation.hideAlert();
  visible_ = false;
  shown_.reset();
  indicators_.reset();
}
