#include <catch2/catch_test_macros.hpp>
#include "timeline/edit_ops.hpp"
#include "timeline/session.hpp"
#include "test_support.hpp"
#include <random>

using namespace nle::timeline;
using nle::test::make_clip;
using nle::test::approx;

namespace {

const TrackId V = "track-video-1";

ProjectState seeded_track() {
    ProjectState p = nle::test::base_project();
    Seconds t = 0.0;
    for(int i = 0; i < 6; ++i) {
        Seconds len = 2.0 + i * 0.5;
        p = insert_clip(p, make_clip("c" + std::to_string(i), V, t, t + len, i * 5.0));
        t += len + (i % 2 ? 0.0 : 1.0);
    }
    return p;
}

Seconds total_duration(const Track& track) {
    Seconds sum = 0.0;
    for(const auto& c : track.clips) sum += c.duration();
    return sum;
}

std::vector<Seconds> gaps(const Track& track) {
    std::vector<Seconds> out;
    for(size_t i = 1; i < track.clips.size(); ++i) out.push_back(track.clips[i].start - track.clips[i - 1].end);
    return out;
}

} // namespace

TEST_CASE("seeded track starts out valid", "[timeline][invariants]") {
    auto p = seeded_track();
    REQUIRE(validate_project(p).ok);
    REQUIRE(p.tracks[0].clips.size() == 6);
}

TEST_CASE("random ripple edits keep every track valid", "[timeline][invariants]") {
    std::mt19937 rng(1234);
    auto p = seeded_track();
    uint64_t split_counter = 1;

    for(int step = 0; step < 300; ++step) {
        const auto& pool = p.tracks[0].clips;
        std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
        const Clip target = pool[pick(rng)];
        std::uniform_real_distribution<double> frac(0.05, 0.95);

        switch(step % 5) {
        case 0:
            p = trim_clip(p, target.id, TrimSide::Right, target.in_point + target.source_duration() * frac(rng) * 1.5, true);
            break;
        case 1:
            p = trim_clip(p, target.id, TrimSide::Left, target.in_point + (frac(rng) - 0.5) * 2.0, true);
            break;
        case 2:
            p = split_clip(p, target.id, target.start + target.duration() * frac(rng),
                           make_split_id(p, target.id, split_counter));
            break;
        case 3:
            if(pool.size() > 3) p = remove_clip(p, target.id, true);
            break;
        case 4: {
            const auto& tr = p.tracks[0].clips;
            for(size_t i = 0; i + 1 < tr.size(); ++i) {
                if(nearly_equal(tr[i].end, tr[i + 1].start)) {
                    p = set_transition(p, tr[i].id, tr[i + 1].id, frac(rng) * 2.0);
                    break;
                }
            }
            break;
        }
        }

        auto v = validate_project(p);
        std::string problems;
        for(const auto& problem : v.problems) problems += problem + "\n";
        INFO("step " << step << "\n" << problems);
        REQUIRE(v.ok);
    }
}

TEST_CASE("ripple trim conserves gaps and shifts by the duration change", "[timeline][invariants][ripple]") {
    auto p = seeded_track();
    const auto before = p.tracks[0];
    auto next = trim_clip(p, "c1", TrimSide::Right, before.clips[1].in_point + 1.0, true);
    const auto& after = next.tracks[0];

    const Seconds delta = after.clips[1].duration() - before.clips[1].duration();
    REQUIRE(approx(delta, 1.0 - 2.5));
    for(size_t i = 2; i < after.clips.size(); ++i) {
        REQUIRE(approx(after.clips[i].start, before.clips[i].start + delta));
    }
    auto g0 = gaps(before);
    auto g1 = gaps(after);
    for(size_t i = 1; i < g0.size(); ++i) REQUIRE(approx(g0[i], g1[i]));
}

TEST_CASE("split keeps the total track duration", "[timeline][invariants][split]") {
    auto p = seeded_track();
    const Seconds before = total_duration(p.tracks[0]);
    uint64_t counter = 1;
    for(const auto& id : {"c0", "c2", "c5"}) {
        const Clip c = nle::test::clip_in(p, id);
        p = split_clip(p, id, c.start + c.duration() / 3.0, make_split_id(p, id, counter));
    }
    REQUIRE(p.tracks[0].clips.size() == 9);
    REQUIRE(approx(total_duration(p.tracks[0]), before, 1e-9));
    REQUIRE(validate_project(p).ok);
}
