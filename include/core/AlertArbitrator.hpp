#pragma once
/** @file  AlertArbitrator.hpp
 *  @brief Picks the one alert to surface and drives the alert surface.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>

#include "core/AlertState.hpp"
#include "core/Settings.hpp"

namespace radflow {
  namespace io {
    class Presentation;
  } // namespace io

  namespace core {

    /**
 * @class AlertArbitrator
 * @brief gender > template > protocol.
 *
 *  * AlertsOnly: the selected alert is shown and only re-sent when it changes;
 *    the surface hides when nothing is active.
 *  * AlwaysShow: every condition is pushed as indicator state whenever the set
 *    of conditions changes.
 */
    class AlertArbitrator {
    public:
      static std::optional<Alert> select(const AlertConditions& conditions);

      void present(const AlertConditions& conditions, const Settings& settings,
                   io::Presentation& presentation);

      /// Hides whatever is showing and forgets it (accession change).
      void reset(io::Presentation& presentation);

      std::optional<Alert> shown() const;

    private:
      void hide(io::Presentation& presentation);

      mutable std::mutex mtx_;
      std::optional<Alert> shown_;
      std::optional<AlertConditions> indicators_;
      bool visible_{ false };
    };

  } // namespace core
} // namespace radflow
