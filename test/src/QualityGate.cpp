#include <doctest/doctest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
#include "QualityGate.hpp"

static Detection makeDet(double conf, double w, double h)
{
    Detection d;
    d.confidence = conf;
    d.bbox = {10.0, 20.0, 10.0 + w, 20.0 + h};
    return d;
}

static GateConfig defaultGate()
{
    GateConfig g;
    g.conf_threshold   = 0.5;
    g.min_bbox_area    = 2000.0;
    g.max_bbox_area    = 500000.0;
    g.min_aspect_ratio = 0.3;
    g.max_aspect_ratio = 4.0;
    return g;
}

// -------------------------------------------------------------------------------------------------
// Inclusive bounds: every threshold value itself is accepted.
// -------------------------------------------------------------------------------------------------
SCENARIO("QualityGate bounds are inclusive")
{
    GIVEN("The default gate")
    {
        QualityGate gate(defaultGate());

        THEN("confidence == conf_threshold is accepted")
        {
            CHECK(gate.accepts(makeDet(0.5, 50, 100)));
            CHECK_FALSE(gate.accepts(makeDet(std::nextafter(0.5, 0.0), 50, 100)));
        }

        THEN("area == min_bbox_area is accepted")
        {
            REQUIRE(QualityGate::area(makeDet(0.9, 40, 50).bbox) == doctest::Approx(2000.0));
            CHECK(gate.accepts(makeDet(0.9, 40, 50)));
            CHECK_FALSE(gate.accepts(makeDet(0.9, 40, 49.9)));
        }

        THEN("area == max_bbox_area is accepted")
        {
            CHECK(gate.accepts(makeDet(0.9, 500, 1000)));
            CHECK_FALSE(gate.accepts(makeDet(0.9, 500, 1000.5)));
        }

        THEN("aspect_ratio == min_aspect_ratio is accepted")
        {
            REQUIRE(QualityGate::aspect_ratio(makeDet(0.9, 100, 30).bbox) == 0.3);
            CHECK(gate.accepts(makeDet(0.9, 100, 30)));
            CHECK_FALSE(gate.accepts(makeDet(0.9, 100, 29.5)));
        }

        THEN("aspect_ratio == max_aspect_ratio is accepted")
        {
            CHECK(gate.accepts(makeDet(0.9, 50, 200)));
            CHECK_FALSE(gate.accepts(makeDet(0.9, 50, 200.5)));
        }
    }
}

SCENARIO("QualityGate rejects degenerate and malformed detections")
{
    GIVEN("A permissive gate")
    {
        GateConfig g;
        g.conf_threshold   = 0.0;
        g.min_bbox_area    = 0.0;
        g.max_bbox_area    = 1e12;
        g.min_aspect_ratio = 0.0;
        g.max_aspect_ratio = 1e6;
        QualityGate gate(g);

        THEN("zero width is rejected regardless of other fields")
        {
            CHECK_FALSE(gate.accepts(makeDet(1.0, 0, 100)));
            CHECK(QualityGate::aspect_ratio(makeDet(1.0, 0, 100).bbox) == 0.0);
        }

        THEN("zero height is rejected")
        {
            CHECK_FALSE(gate.accepts(makeDet(1.0, 100, 0)));
        }

        THEN("an inverted box does not gain a positive area")
        {
            Detection d = makeDet(1.0, -50, -80);
            CHECK(QualityGate::area(d.bbox) == 0.0);
            CHECK_FALSE(gate.accepts(d));
        }

        THEN("non-finite coordinates are rejected")
        {
            Detection d = makeDet(1.0, 50, 80);
            d.bbox.x2 = std::numeric_limits<double>::quiet_NaN();
            CHECK_FALSE(gate.accepts(d));
        }
    }

    GIVEN("The default gate")
    {
        QualityGate gate(defaultGate());

        THEN("confidence outside [0, 1] is normalized to 0 and fails")
        {
            CHECK(QualityGate::normalized_confidence(1.7) == 0.0);
            CHECK(QualityGate::normalized_confidence(-0.2) == 0.0);
            CHECK(QualityGate::normalized_confidence(std::nan("")) == 0.0);
            CHECK_FALSE(gate.accepts(makeDet(1.7, 50, 100)));
            CHECK_FALSE(gate.accepts(makeDet(std::nan(""), 50, 100)));
        }
    }
}

// -------------------------------------------------------------------------------------------------
// Raising the confidence threshold can only shrink the accepted set.
// -------------------------------------------------------------------------------------------------
SCENARIO("QualityGate confidence monotonicity")
{
    GIVEN("A mixed set of detections")
    {
        std::vector<Detection> dets;
        for (int i = 0; i < 40; ++i) {
            const double conf = std::fmod(i * 0.137, 1.0);
            const double w    = 30.0 + 7.0 * (i % 9);
            const double h    = 40.0 + 11.0 * (i % 7);
            dets.push_back(makeDet(conf, w, h));
        }

        WHEN("the threshold is stepped from 0 to 1")
        {
            GateConfig g = defaultGate();
            std::vector<bool> prev(dets.size(), true);
            size_t prev_count = dets.size();

            for (int step = 0; step <= 20; ++step) {
                g.conf_threshold = step / 20.0;
                QualityGate gate(g);
                size_t count = 0;
                for (size_t i = 0; i < dets.size(); ++i) {
                    const bool ok = gate.accepts(dets[i]);
                    if (ok) ++count;
                    CHECK((!ok || prev[i]));   // accepted now implies accepted before
                    prev[i] = ok;
                }
                CHECK(count <= prev_count);
                prev_count = count;
            }
        }
    }
}

SCENARIO("GateConfig validation")
{
    GIVEN("An otherwise valid gate")
    {
        GateConfig g = defaultGate();
        CHECK_NOTHROW(g.validate("event_detector"));

        WHEN("min_bbox_area exceeds max_bbox_area")
        {
            g.min_bbox_area = 600000.0;
            CHECK_THROWS_AS(g.validate("event_detector"), std::invalid_argument);
        }

        WHEN("min_aspect_ratio exceeds max_aspect_ratio")
        {
            g.min_aspect_ratio = 5.0;
            CHECK_THROWS_AS(g.validate("event_detector"), std::invalid_argument);
        }

        WHEN("the confidence threshold is above 1")
        {
            g.conf_threshold = 1.5;
            CHECK_THROWS_AS(g.validate("activity_filter"), std::invalid_argument);
        }
    }
}
