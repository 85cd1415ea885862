#include <catch2/catch.hpp>
#include "wizard_state.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>

using namespace cortex;

TEST_CASE("wizard_steps: fixed canonical order", "[wizard_state]") {
    const auto& steps = wizard_steps();
    REQUIRE(steps.size() == 7);
    REQUIRE(steps.front() == WizardStep::Welcome);
    REQUIRE(steps[1] == WizardStep::ProviderSetup);
    REQUIRE(steps.back() == WizardStep::Complete);
}

TEST_CASE("step names: round trip and legacy alias", "[wizard_state]") {
    for (WizardStep step : wizard_steps()) {
        REQUIRE(step_from_string(step_to_string(step)) == step);
    }
    REQUIRE(step_from_string("api_setup") == WizardStep::ProviderSetup);
    REQUIRE_FALSE(step_from_string("bogus"));
}

TEST_CASE("WizardState: completed and skipped never overlap", "[wizard_state]") {
    WizardState s = WizardState::fresh();
    s.mark_skipped(WizardStep::Preferences);
    s.mark_completed(WizardStep::Preferences);
    REQUIRE(s.is_completed(WizardStep::Preferences));
    REQUIRE_FALSE(s.is_skipped(WizardStep::Preferences));

    s.mark_skipped(WizardStep::Preferences);
    REQUIRE_FALSE(s.is_skipped(WizardStep::Preferences));
}

TEST_CASE("WizardState: no duplicates", "[wizard_state]") {
    WizardState s = WizardState::fresh();
    s.mark_completed(WizardStep::Welcome);
    s.mark_completed(WizardStep::Welcome);
    s.mark_skipped(WizardStep::TestCommand);
    s.mark_skipped(WizardStep::TestCommand);
    REQUIRE(s.completed_steps.size() == 1);
    REQUIRE(s.skipped_steps.size() == 1);
}

TEST_CASE("WizardState: completed_at is stamped once", "[wizard_state]") {
    WizardState s = WizardState::fresh();
    s.stamp_completed("2026-01-01T00:00:00Z");
    s.stamp_completed("2027-01-01T00:00:00Z");
    REQUIRE(s.completed_at == std::string("2026-01-01T00:00:00Z"));
}

TEST_CASE("WizardState: serialize and parse preserves order", "[wizard_state]") {
    WizardState s;
    s.current_step = WizardStep::ShellIntegration;
    s.started_at = "2026-03-01T10:00:00Z";
    s.mark_completed(WizardStep::ProviderSetup);
    s.mark_completed(WizardStep::Welcome);
    s.mark_skipped(WizardStep::HardwareDetection);
    s.merge_data({{"provider", "openai"}});

    WizardState parsed = WizardState::from_json(nlohmann::json::parse(s.to_json().dump()));
    REQUIRE(parsed == s);
    REQUIRE(parsed.completed_steps ==
            std::vector<WizardStep>{WizardStep::ProviderSetup, WizardStep::Welcome});
    REQUIRE_FALSE(parsed.completed_at);
}

TEST_CASE("WizardState::from_json: unknown fields ignored, timestamp defaulted", "[wizard_state]") {
    auto s = WizardState::from_json({
        {"current_step", "preferences"},
        {"completed_steps", {"welcome", "nonsense"}},
        {"extra", {1, 2, 3}}
    });
    REQUIRE(s.current_step == WizardStep::Preferences);
    REQUIRE(s.completed_steps == std::vector<WizardStep>{WizardStep::Welcome});
    REQUIRE_FALSE(s.started_at.empty());
    REQUIRE(s.collected_data.is_object());
}

TEST_CASE("WizardState: save and load through a file", "[wizard_state]") {
    TempHome home;
    WizardState s = WizardState::fresh();
    s.mark_completed(WizardStep::Welcome);
    s.stamp_completed("2026-01-01T00:00:00Z");
    REQUIRE(s.save(home.paths.state_file()));

    auto loaded = WizardState::load(home.paths.state_file());
    REQUIRE(loaded);
    REQUIRE(*loaded == s);
}

TEST_CASE("WizardState::load: missing or malformed file yields nothing", "[wizard_state]") {
    TempHome home;
    REQUIRE_FALSE(WizardState::load(home.paths.state_file()));
    home.write(home.paths.state_file(), "[broken");
    REQUIRE_FALSE(WizardState::load(home.paths.state_file()));
}
