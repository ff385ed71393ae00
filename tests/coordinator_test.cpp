// radflow-Prod headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ReadingCoordinator.hpp"
#include "core/SettingsStore.hpp"

// radflow-Fake headers
#include "FakeClock.hpp"
#include "FakeOracle.hpp"
#include "RecordingCommander.hpp"
#include "RecordingPresenter.hpp"
#include "TestSettings.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <algorithm>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

namespace radflow::test {

  using core::ActionKind;
  using core::ActionRequest;
  using core::ReadingCoordinator;
  using io::Keystroke;
  using ::testing::HasSubstr;

  class ReadingCoordinatorTest : public ::testing::Test {
  protected:
    ReadingCoordinatorTest()
        : settings(fastSettings()),
          coordinator(ReadingCoordinator::Collaborators{ oracle, desktop, presenter, presenter,
                                                         presenter },
                      settings, log, errors, &deferrer, &clock) {}

    void configure(const std::function<void(core::Settings&)>& edit) {
      auto s = fastSettings();
      edit(s);
      coordinator.applySettings(s);
    }

    void run(ActionKind kind, std::string_view source = core::sources::kManual) {
      coordinator.enqueue(ActionRequest{ kind, std::string(source) });
      coordinator.drainPending();
    }

    void openStudy(const std::string& accession, const std::string& report = "FINDINGS: x\n",
                   const std::string& description = "CT CHEST") {
      oracle.show(accession, report, description);
      coordinator.pollNow();
    }

    bool toasted(const std::string& text) const {
      return std::find(presenter.toasts.begin(), presenter.toasts.end(), text) !=
             presenter.toasts.end();
    }

    FakeOracle oracle;
    RecordingCommander desktop;
    RecordingPresenter presenter;
    FakeClock clock;
    ImmediateDeferrer deferrer;
    core::Logger log;
    core::ErrorMonitor errors;
    core::SettingsStore settings;
    ReadingCoordinator coordinator;
  };

  // ---- critical notes -------------------------------------------------------

  TEST_F(ReadingCoordinatorTest, CriticalNoteCreatedOncePerStudy) {
    openStudy("A");
    run(ActionKind::CreateCriticalNote);
    run(ActionKind::CreateCriticalNote);

    EXPECT_EQ(desktop.criticalNoteCalls, 1);
    EXPECT_TRUE(coordinator.hasCriticalNoteFor("A"));
    EXPECT_TRUE(toasted("Critical note created for A"));
  }

  TEST_F(ReadingCoordinatorTest, CriticalNoteWithoutStudy) {
    run(ActionKind::CreateCriticalNote);
    EXPECT_EQ(desktop.criticalNoteCalls, 0);
    EXPECT_TRUE(toasted("No study open"));
  }

  TEST_F(ReadingCoordinatorTest, FailedCriticalNoteIsRetried) {
    openStudy("A");
    desktop.criticalNoteOk = false;
    run(ActionKind::CreateCriticalNote);
    EXPECT_TRUE(toasted("Critical note creation failed"));
    EXPECT_FALSE(coordinator.hasCriticalNoteFor("A"));

    desktop.criticalNoteOk = true;
    run(ActionKind::CreateCriticalNote);
    EXPECT_EQ(desktop.criticalNoteCalls, 2);
    EXPECT_TRUE(coordinator.hasCriticalNoteFor("A"));
  }

  TEST_F(ReadingCoordinatorTest, NewStudyAllowsNewCriticalNote) {
    openStudy("A");
    run(ActionKind::CreateCriticalNote);
    openStudy("B");
    run(ActionKind::CreateCriticalNote);
    EXPECT_EQ(desktop.criticalNoteCalls, 2);
    EXPECT_FALSE(coordinator.hasCriticalNoteFor("A"));
  }

  TEST_F(ReadingCoordinatorTest, ProtocolStudyGetsOneNoteFromProcessAndPoller) {
    configure([](core::Settings& s) {
      s.protocolDetectionEnabled = true;
      s.protocolAutoCreateNote = true;
    });
    oracle.protocolFlags["A"] = true;
    openStudy("A");

    run(ActionKind::ProcessReport);
    coordinator.pollNow();
    coordinator.drainPending();
    EXPECT_EQ(desktop.criticalNoteCalls, 1);
  }

  // ---- pick lists -----------------------------------------------------------

  namespace {
    core::PickList list(const std::string& name, std::vector<core::PickListItem> items,
                        core::StudyCriteria criteria = {}) {
      core::PickList l;
      l.name = name;
      l.criteria = std::move(criteria);
      l.items = std::move(items);
      return l;
    }
  } // namespace

  TEST_F(ReadingCoordinatorTest, PickListItemPasted) {
    configure([](core::Settings& s) {
      s.pickLists = { list("Chest", { { "Normal", "No acute process.", "" } }) };
    });
    coordinator.selectPickListItem("Chest", 0);
    coordinator.drainPending();

    EXPECT_EQ(desktop.clipboardWrites, (std::vector<std::string>{ "No acute process." }));
    EXPECT_EQ(desktop.count(Keystroke::Paste), 1u);
  }

  TEST_F(ReadingCoordinatorTest, PickListReferenceExpandsBuilder) {
    configure([](core::Settings& s) {
      s.pickLists = { list("Chest", { { "Nodule", "Pulmonary nodule.", "Follow-up" } }),
                      list("Follow-up", { { "a", "Six month CT.", "" },
                                          { "b", "", "" },
                                          { "c", "Fleischner criteria.", "" } }) };
    });
    coordinator.selectPickListItem("Chest", 0);
    coordinator.drainPending();

    ASSERT_EQ(desktop.clipboardWrites.size(), 1u);
    EXPECT_EQ(desktop.clipboardWrites[0], "Pulmonary nodule. Six month CT. Fleischner criteria.");
  }

  TEST_F(ReadingCoordinatorTest, InvalidPickListReferenceShowsNoticeOnly) {
    configure([](core::Settings& s) {
      s.pickLists = { list("Chest", { { "Nodule", "Pulmonary nodule.", "Missing" } }) };
    });
    coordinator.selectPickListItem("Chest", 0);
    coordinator.drainPending();

    ASSERT_EQ(presenter.notices.size(), 1u);
    EXPECT_EQ(presenter.notices[0].first, "Builder Not Found");
    EXPECT_EQ(presenter.notices[0].second,
              "The referenced builder list is not available: 'Missing'");
    EXPECT_TRUE(desktop.clipboardWrites.empty());
    EXPECT_TRUE(desktop.keystrokes.empty());
    EXPECT_EQ(errors.failureCount(), 0u);
  }

  TEST_F(ReadingCoordinatorTest, DisabledBuilderCountsAsMissing) {
    configure([](core::Settings& s) {
      auto builder = list("Follow-up", { { "a", "Six month CT.", "" } });
      builder.enabled = false;
      s.pickLists = { list("Chest", { { "Nodule", "Nodule.", "Follow-up" } }), builder };
    });
    coordinator.selectPickListItem("Chest", 0);
    coordinator.drainPending();
    EXPECT_EQ(presenter.notices.size(), 1u);
    EXPECT_TRUE(desktop.clipboardWrites.empty());
  }

  TEST_F(ReadingCoordinatorTest, FailingActionReachesErrorToastAndCleanupStillRuns) {
    configure([](core::Settings& s) {
      s.pickLists = { list("Chest", { { "Normal", "No acute process.", "" } }) };
    });
    coordinator.selectPickListItem("Chest", 7);
    coordinator.drainPending();

    EXPECT_EQ(errors.failureCount(), 1u);
    ASSERT_FALSE(presenter.toasts.empty());
    EXPECT_THAT(presenter.toasts.back(), HasSubstr("Insert Pick List Text"));
    EXPECT_EQ(desktop.calls.front(), "saveFocus");
    EXPECT_EQ(desktop.calls.back(), "restoreFocus");
    EXPECT_EQ(presenter.overlayRaises, 1);

    // the loop keeps serving actions
    run(ActionKind::SignReport);
    EXPECT_EQ(desktop.count(Keystroke::SignReport), 1u);
  }

  TEST_F(ReadingCoordinatorTest, AvailablePickListsFollowStudyDescription) {
    configure([](core::Settings& s) {
      s.pickLists = { list("Chest", {}, core::StudyCriteria{ {}, { "CHEST", "THORAX" } }),
                      list("Head", {}, core::StudyCriteria{ { "HEAD" }, {} }),
                      list("Any", {}) };
    });
    openStudy("A", "", "CT CHEST W CONTRAST");
    EXPECT_EQ(coordinator.availablePickLists(), (std::vector<std::string>{ "Chest", "Any" }));
  }

  // ---- button and hotkey mapping -------------------------------------------

  TEST_F(ReadingCoordinatorTest, HotkeyReleasesModifiersFirst) {
    configure([](core::Settings& s) { s.actionBindings[ActionKind::ToggleRecord].hotkey = "F2"; });
    EXPECT_TRUE(coordinator.onHotkey("F2"));
    EXPECT_FALSE(coordinator.onHotkey("F9"));
    coordinator.drainPending();

    ASSERT_EQ(desktop.keystrokes.size(), 2u);
    EXPECT_EQ(desktop.keystrokes[0], Keystroke::ReleaseModifiers);
    EXPECT_EQ(desktop.keystrokes[1], Keystroke::ToggleRecord);
  }

  TEST_F(ReadingCoordinatorTest, DeviceButtonMapsToBoundAction) {
    configure([](core::Settings& s) {
      s.actionBindings[ActionKind::CreateImpression].micButton = "Skip Forward";
    });
    EXPECT_TRUE(coordinator.onDeviceButton("Skip Forward"));
    EXPECT_FALSE(coordinator.onDeviceButton("Tab Forward"));
    EXPECT_EQ(coordinator.queue().pending(), 1u);
  }

  TEST_F(ReadingCoordinatorTest, CheckmarkSignSendsNoKeystroke) {
    configure([](core::Settings& s) {
      s.actionBindings[ActionKind::SignReport].micButton = "Checkmark";
    });
    coordinator.onDeviceButton("Checkmark");
    coordinator.drainPending();
    EXPECT_EQ(desktop.count(Keystroke::SignReport), 0u);
    EXPECT_TRUE(coordinator.poller().caseContext().isSigned);

    run(ActionKind::SignReport);
    EXPECT_EQ(desktop.count(Keystroke::SignReport), 1u);
  }

  TEST_F(ReadingCoordinatorTest, SkipBackProcessSuppressedOnlyWhenNotRecording) {
    configure([](core::Settings& s) {
      s.actionBindings[ActionKind::ProcessReport].micButton = "Skip Back";
    });
    coordinator.onDeviceButton("Skip Back");
    coordinator.drainPending();
    EXPECT_EQ(desktop.count(Keystroke::ProcessReport), 0u);

    oracle.recording = true;
    coordinator.syncDictationNow();
    coordinator.onDeviceButton("Skip Back");
    coordinator.drainPending();
    EXPECT_EQ(desktop.count(Keystroke::ProcessReport), 1u);
  }

  TEST_F(ReadingCoordinatorTest, SkipForwardCreateImpressionSkipsClick) {
    run(ActionKind::CreateImpression, core::sources::kSkipForward);
    EXPECT_EQ(std::count(desktop.calls.begin(), desktop.calls.end(), "clickCreateImpression"), 0);
    run(ActionKind::CreateImpression);
    EXPECT_TRUE(toasted("Impression created"));
  }

  TEST_F(ReadingCoordinatorTest, DeadManButtonHoldsDictation) {
    configure([](core::Settings& s) {
      s.deadManSwitch = true;
      s.actionBindings[ActionKind::ToggleRecord].micButton = "Record Button";
    });
    EXPECT_TRUE(coordinator.onDeviceButton("Record Button"));
    EXPECT_EQ(coordinator.queue().pending(), 0u);

    coordinator.onRecordButtonState(true);
    coordinator.drainPending();
    EXPECT_TRUE(coordinator.recordingBelieved());

    oracle.recording = true;
    coordinator.onRecordButtonState(false);
    coordinator.drainPending();
    EXPECT_FALSE(coordinator.recordingBelieved());
    EXPECT_EQ(desktop.count(Keystroke::ToggleRecord), 2u);
  }

  TEST_F(ReadingCoordinatorTest, RecordButtonTogglesWithoutDeadMan) {
    configure([](core::Settings& s) {
      s.actionBindings[ActionKind::ToggleRecord].micButton = "Record Button";
    });
    coordinator.onRecordButtonState(true);
    coordinator.onRecordButtonState(false);
    EXPECT_EQ(coordinator.queue().pending(), 1u);
  }

  // ---- study lifecycle through actions -------------------------------------

  TEST_F(ReadingCoordinatorTest, DiscardClosesUnsignedImmediatelyAndOnlyOnce) {
    openStudy("A");
    run(ActionKind::DiscardStudy);

    ASSERT_EQ(presenter.studyEvents.size(), 1u);
    EXPECT_EQ(presenter.studyEvents[0].first, "A");
    EXPECT_EQ(presenter.studyEvents[0].second, io::StudyOutcome::ClosedUnsigned);
    EXPECT_FALSE(coordinator.isCaseOpen());

    coordinator.pollNow(); // still on screen
    openStudy("B");
    EXPECT_EQ(presenter.studyEvents.size(), 1u);
    EXPECT_EQ(coordinator.currentAccession(), "B");
  }

  TEST_F(ReadingCoordinatorTest, FailedDiscardKeepsStudyOpen) {
    openStudy("A");
    desktop.discardOk = false;
    run(ActionKind::DiscardStudy);
    EXPECT_TRUE(presenter.studyEvents.empty());
    EXPECT_TRUE(coordinator.isCaseOpen());
    EXPECT_TRUE(toasted("Discard failed: control not found"));

    // the close on the next accession change still reports the discard intent
    openStudy("");
    ASSERT_EQ(presenter.studyEvents.size(), 1u);
    EXPECT_EQ(presenter.studyEvents[0].second, io::StudyOutcome::ClosedUnsigned);
  }

  TEST_F(ReadingCoordinatorTest, SignedStudyClosesAsSigned) {
    openStudy("A");
    run(ActionKind::SignReport);
    openStudy("B");
    ASSERT_EQ(presenter.studyEvents.size(), 1u);
    EXPECT_EQ(presenter.studyEvents[0].second, io::StudyOutcome::Signed);
  }

  TEST_F(ReadingCoordinatorTest, ShowReportToggles) {
    openStudy("A", "FINDINGS: one\n");
    run(ActionKind::ShowReport);
    run(ActionKind::ShowReport);
    EXPECT_EQ(presenter.reportCalls, (std::vector<std::string>{ "show", "hide" }));
  }

  TEST_F(ReadingCoordinatorTest, ShowReportWithoutTextToasts) {
    run(ActionKind::ShowReport);
    EXPECT_TRUE(presenter.reportCalls.empty());
    EXPECT_TRUE(toasted("No report available"));
  }

  TEST_F(ReadingCoordinatorTest, ProcessAutoStopsDictationAndScrolls) {
    configure([](core::Settings& s) {
      s.autoStopDictation = true;
      s.scrollToBottomOnProcess = true;
      s.showLineCountToast = true;
    });
    std::string report;
    for (int i = 0; i < 35; ++i)
      report += "line\n";
    openStudy("A", report);

    oracle.recording = true;
    coordinator.syncDictationNow();
    run(ActionKind::ProcessReport);

    EXPECT_FALSE(coordinator.recordingBelieved());
    EXPECT_EQ(desktop.count(Keystroke::ToggleRecord), 1u);
    EXPECT_EQ(desktop.count(Keystroke::ProcessReport), 1u);
    EXPECT_EQ(desktop.count(Keystroke::PageDown), 2u);
    EXPECT_TRUE(toasted("35 lines, 2 page(s) down"));
    EXPECT_TRUE(coordinator.poller().caseContext().processPressed);
  }

  TEST_F(ReadingCoordinatorTest, ScrollThresholdsAreInclusive) {
    configure([](core::Settings& s) {
      s.scrollToBottomOnProcess = true;
      s.showLineCountToast = true;
    });
    std::string report;
    for (int i = 0; i < 10; ++i)
      report += "line\n";
    openStudy("A", report);

    run(ActionKind::ProcessReport);
    EXPECT_EQ(desktop.count(Keystroke::PageDown), 1u);
    EXPECT_TRUE(toasted("10 lines, 1 page(s) down"));

    // the reporting app is brought forward again before paging
    const auto page = std::find(desktop.calls.begin(), desktop.calls.end(), "key:page_down");
    ASSERT_NE(page, desktop.calls.end());
    EXPECT_EQ(*std::prev(page), "activate");
  }

  TEST_F(ReadingCoordinatorTest, NoScrollBeforeAnyReportIsScraped) {
    configure([](core::Settings& s) {
      s.scrollToBottomOnProcess = true;
      s.showLineCountToast = true;
    });
    run(ActionKind::ProcessReport);
    EXPECT_EQ(desktop.count(Keystroke::PageDown), 0u);
    EXPECT_TRUE(presenter.toasts.empty());
  }

  TEST_F(ReadingCoordinatorTest, SkipBackSourceSendsProcessWhenNotMappedToSkipBack) {
    configure([](core::Settings& s) {
      s.actionBindings[ActionKind::ProcessReport].micButton = "Checkmark";
    });
    run(ActionKind::ProcessReport, core::sources::kSkipBack);
    EXPECT_EQ(desktop.count(Keystroke::ProcessReport), 1u);
  }

  TEST_F(ReadingCoordinatorTest, ProcessReleasesModifiersExactlyOnce) {
    configure([](core::Settings& s) { s.actionBindings[ActionKind::ProcessReport].hotkey = "F5"; });
    run(ActionKind::ProcessReport);
    EXPECT_EQ(desktop.keystrokes,
              (std::vector<Keystroke>{ Keystroke::ReleaseModifiers, Keystroke::ProcessReport }));

    desktop.keystrokes.clear();
    coordinator.onHotkey("F5");
    coordinator.drainPending();
    EXPECT_EQ(desktop.keystrokes,
              (std::vector<Keystroke>{ Keystroke::ReleaseModifiers, Keystroke::ProcessReport }));
  }

  TEST_F(ReadingCoordinatorTest, MacrosPastedWhenClinicalHistoryAppears) {
    configure([](core::Settings& s) {
      s.macrosEnabled = true;
      s.macros = { core::Macro{ "chest", true, core::StudyCriteria{ { "CHEST" }, {} }, "Chest macro." } };
    });
    openStudy("A", "EXAM: CT CHEST\nCLINICAL HISTORY: cough\n");
    coordinator.drainPending();

    EXPECT_EQ(desktop.clipboardWrites, (std::vector<std::string>{ "Chest macro." }));
    EXPECT_EQ(desktop.count(Keystroke::Paste), 1u);
  }

  TEST_F(ReadingCoordinatorTest, SystemBeepFlipsBeliefWithoutKeystroke) {
    run(ActionKind::SystemBeep);
    EXPECT_TRUE(coordinator.recordingBelieved());
    EXPECT_TRUE(desktop.keystrokes.empty());
    ASSERT_FALSE(presenter.cues.empty());
    EXPECT_EQ(presenter.cues.front().hz, core::DictationReconciler::kStartCueHz);
  }

  TEST_F(ReadingCoordinatorTest, HousekeepingRaisesOverlaysAndRefreshesIndicator) {
    coordinator.housekeepingNow();
    EXPECT_EQ(presenter.overlayRaises, 1);
    EXPECT_EQ(presenter.recordingIndicator, (std::vector<bool>{ false }));
  }

} // namespace radflow::test
