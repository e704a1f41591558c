#include <catch2/catch_test_macros.hpp>
#include "commands/editor.hpp"
#include "test_support.hpp"
#include <vector>

using namespace nle::commands;
using namespace nle::timeline;
using nle::test::approx;
using nle::test::make_clip;
using nle::test::clip_in;

namespace {
const TrackId V = "track-video-1";

void seed(Editor& editor) {
    editor.add_asset(nle::test::make_asset("asset-1"));
    editor.insert(make_clip("a", V, 0, 5));
    editor.insert(make_clip("b", V, 5, 8, 10.0));
}
} // namespace

TEST_CASE("edits that change nothing add no history step", "[editor]") {
    Editor editor;
    seed(editor);
    const auto depth = editor.history().undo_depth();
    REQUIRE_FALSE(editor.trim("missing", TrimSide::Right, 1.0));
    REQUIRE_FALSE(editor.split("a", 9.0));
    REQUIRE_FALSE(editor.set_aspect_ratio("16:9"));
    REQUIRE(editor.history().undo_depth() == depth);
}

TEST_CASE("undo and redo round trip the project", "[editor][history]") {
    Editor editor;
    seed(editor);
    const auto before = editor.project();
    REQUIRE(editor.trim("a", TrimSide::Right, 3.0, false));
    const auto after = editor.project();
    REQUIRE(approx(clip_in(after, "a").end, 3.0));

    REQUIRE(editor.undo());
    REQUIRE(editor.project() == before);
    REQUIRE(editor.redo());
    REQUIRE(editor.project() == after);

    // undo back to the empty default project
    while(editor.undo()) {}
    REQUIRE(editor.project().tracks == default_tracks());
    REQUIRE_FALSE(editor.can_undo());
}

TEST_CASE("a mixed edit sequence undoes and redoes exactly", "[editor][history]") {
    Editor editor;
    editor.add_asset(nle::test::make_asset("asset-1"));
    const ProjectState initial = editor.project();

    std::vector<ProjectState> states;
    auto step = [&](bool changed) {
        REQUIRE(changed);
        states.push_back(editor.project());
    };
    step(editor.insert(make_clip("a", V, 0, 5)));
    step(editor.insert(make_clip("b", V, 5, 8, 10.0)));
    step(editor.trim("a", TrimSide::Right, 4.0, true));
    step(editor.set_transition("a", "b", 1.0));
    step(editor.split("b", 5.5));
    step(editor.insert(make_clip("c", V, 20, 22)));
    step(editor.move("c", V, 15.0, false));
    step(editor.remove("c"));
    const ProjectState final_state = editor.project();
    REQUIRE(clip_in(final_state, "a").transition);

    for(size_t i = states.size(); i > 0; --i) {
        REQUIRE(editor.undo());
        const ProjectState& expected = i > 1 ? states[i - 2] : initial;
        REQUIRE(editor.project() == expected);
    }
    REQUIRE(editor.project() == initial);

    for(size_t i = 0; i < states.size(); ++i) {
        REQUIRE(editor.redo());
        REQUIRE(editor.project() == states[i]);
    }
    REQUIRE(editor.project() == final_state);
    REQUIRE_FALSE(editor.can_redo());
}

TEST_CASE("ripple default applies when no override is given", "[editor]") {
    Editor editor;
    seed(editor);
    REQUIRE_FALSE(editor.ripple_default());
    editor.set_ripple_default(true);
    REQUIRE(editor.trim("a", TrimSide::Right, 3.0));
    REQUIRE(approx(clip_in(editor.project(), "b").start, 3.0));
    REQUIRE(editor.trim("a", TrimSide::Right, 2.0, false));
    REQUIRE(approx(clip_in(editor.project(), "b").start, 3.0));
}

TEST_CASE("split at the playhead prefers the selected clip", "[editor]") {
    Editor editor;
    seed(editor);
    editor.insert(make_clip("c", "track-audio-1", 0, 8, 0.0));
    editor.set_playhead(2.0);
    editor.set_selection({"c"});
    REQUIRE(editor.split_at_playhead());
    REQUIRE(find_clip(editor.project().tracks, "c-split-1"));
    REQUIRE(find_clip(editor.project().tracks, "a-split-1") == nullptr);

    // without a selection the first clip under the playhead wins
    editor.clear_selection();
    REQUIRE(editor.split_at_playhead());
    REQUIRE(find_clip(editor.project().tracks, "a-split-2"));
    REQUIRE(approx(clip_in(editor.project(), "a").end, 2.0));

    editor.set_playhead(20.0);
    REQUIRE_FALSE(editor.split_at_playhead());
}

TEST_CASE("deleting the selection ripples by default", "[editor]") {
    Editor editor;
    seed(editor);
    REQUIRE_FALSE(editor.delete_selection());
    editor.set_selection({"a", "nope"});
    REQUIRE(editor.selection().size() == 1);
    REQUIRE(editor.delete_selection());
    REQUIRE(approx(clip_in(editor.project(), "b").start, 0.0));
    REQUIRE(editor.selection().empty());
}

TEST_CASE("attached metadata survives undo", "[editor][asset]") {
    Editor editor;
    seed(editor);
    const auto depth = editor.history().undo_depth();
    AssetMetadataPatch patch;
    patch.width = 1280;
    patch.waveform = std::vector<float>{0.1f, 0.5f};
    REQUIRE(editor.attach_asset_metadata("asset-1", patch));
    REQUIRE(editor.history().undo_depth() == depth);

    editor.undo();
    editor.undo();
    const Asset* asset = find_asset(editor.project(), "asset-1");
    REQUIRE(asset);
    REQUIRE(asset->metadata.width == 1280);
    REQUIRE(asset->metadata.waveform.size() == 2);
    REQUIRE_FALSE(editor.attach_asset_metadata("missing", patch));
}

TEST_CASE("project listeners see every committed change", "[editor]") {
    Editor editor;
    int calls = 0;
    auto id = editor.add_project_listener([&](const ProjectState&){ ++calls; });
    seed(editor);
    REQUIRE(calls == 3);
    editor.undo();
    REQUIRE(calls == 4);
    editor.trim("missing", TrimSide::Left, 0.0);
    REQUIRE(calls == 4);
    REQUIRE(editor.remove_project_listener(id));
    editor.redo();
    REQUIRE(calls == 4);
}

TEST_CASE("load_project replaces the model and clears history", "[editor]") {
    Editor editor;
    seed(editor);
    editor.set_selection({"a"});

    auto p = nle::test::base_project();
    p = insert_clip(p, make_clip("z", V, 0, 12));
    editor.load_project(p, 4.0, 50.0);
    REQUIRE(editor.project() == p);
    REQUIRE_FALSE(editor.can_undo());
    REQUIRE_FALSE(editor.can_redo());
    REQUIRE(editor.selection().empty());
    REQUIRE(approx(editor.session().transport.playhead, 4.0));
    REQUIRE(approx(editor.session().transport.zoom, 50.0));
    REQUIRE(approx(editor.transport().duration(), 12.0));
}

TEST_CASE("transport shortcuts keep the session in sync", "[editor][transport]") {
    Editor editor;
    seed(editor);
    editor.nudge_playhead(3);
    REQUIRE(approx(editor.session().transport.playhead, 3.0));
    editor.play();
    REQUIRE(editor.session().transport.is_playing);
    editor.transport().advance(10.0);
    REQUIRE_FALSE(editor.session().transport.is_playing);
    REQUIRE(approx(editor.session().transport.playhead, 8.0));
    editor.zoom_in();
    REQUIRE(approx(editor.session().transport.zoom, 110.0, 1e-9));
}
