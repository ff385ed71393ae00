#pragma once
/** @file  SettingsStore.hpp
 *  @brief Thread-safe settings holder shared by the worker, timers & settings dialog.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <mutex>

#include "core/Settings.hpp"

namespace radflow {
  namespace core {

    /** @class SettingsStore
 *  @brief Lock-protected Settings value.
 *
 *  * Readers take a full copy per action or poll cycle so one cycle never sees
 *    half of an update.
 *  * The settings dialog swaps the whole value; `revision()` bumps on each swap.
 */
    class SettingsStore {

    public:
      SettingsStore() = default;
      explicit SettingsStore(Settings initial) : settings_(std::move(initial)) {}
      ~SettingsStore() = default;

      Settings snapshot() const;

      void replace(Settings next);

      std::uint64_t revision() const;

    private:
      mutable std::mutex mtx_;
      Settings settings_;
      std::uint64_t revision_{ 0 };
    };

  } // namespace core
} // namespace radflow
