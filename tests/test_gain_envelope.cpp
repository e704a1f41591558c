#include <catch2/catch_test_macros.hpp>
#include "audio/gain_envelope.hpp"
#include "test_support.hpp"

using nle::audio::GainEnvelope;
using nle::test::approx;

TEST_CASE("empty envelope reports its default", "[audio][envelope]") {
    GainEnvelope env;
    REQUIRE(env.empty());
    REQUIRE(approx(env.value_at(3.0), 1.0));
    GainEnvelope quiet(0.25f);
    REQUIRE(approx(quiet.value_at(0.0), 0.25));
}

TEST_CASE("set value jumps and ramps interpolate from the previous event", "[audio][envelope]") {
    GainEnvelope env;
    env.set_value_at(0.0f, 1.0);
    env.linear_ramp_to(1.0f, 2.0);
    env.linear_ramp_to(0.0f, 4.0);

    REQUIRE(approx(env.value_at(0.5), 1.0));     // before the first event
    REQUIRE(approx(env.value_at(1.0), 0.0));
    REQUIRE(approx(env.value_at(1.5), 0.5, 1e-6));
    REQUIRE(approx(env.value_at(2.0), 1.0));
    REQUIRE(approx(env.value_at(3.0), 0.5, 1e-6));
    REQUIRE(approx(env.value_at(10.0), 0.0));
    REQUIRE(approx(env.last_time(), 4.0));
}

TEST_CASE("a leading ramp starts from the default value", "[audio][envelope]") {
    GainEnvelope env;
    env.linear_ramp_to(0.0f, 2.0);
    REQUIRE(approx(env.value_at(0.0), 1.0));
    REQUIRE(approx(env.value_at(1.0), 0.5, 1e-6));
}

TEST_CASE("events never go back in time", "[audio][envelope]") {
    GainEnvelope env;
    env.set_value_at(0.2f, 5.0);
    env.linear_ramp_to(1.0f, 3.0);
    REQUIRE(env.events().size() == 2);
    REQUIRE(approx(env.events()[1].time, 5.0));
    REQUIRE(approx(env.value_at(6.0), 1.0));
    env.clear();
    REQUIRE(env.empty());
}
