#include <doctest/doctest.h>
#include <sstream>
#include <stdexcept>
#include "Config.hpp"

static IniFile iniFrom(const std::string& text)
{
    IniFile ini;
    std::istringstream in(text);
    ini.parse(in);
    return ini;
}

SCENARIO("IniFile parsing")
{
    GIVEN("Sections, comments and padding")
    {
        IniFile ini = iniFrom(
            "# leading comment\n"
            "[activity_filter]\n"
            "  person_conf_threshold =  0.35   # trailing\n"
            "; another comment\n"
            "[event_detector]\r\n"
            "min_track_length=20\r\n");

        THEN("values are trimmed and comments dropped")
        {
            CHECK(ini.has_section("activity_filter"));
            CHECK(ini.get("activity_filter", "person_conf_threshold").value() == "0.35");
            CHECK(ini.get("event_detector", "min_track_length").value() == "20");
            CHECK_FALSE(ini.get("event_detector", "conf_threshold").has_value());
            CHECK_FALSE(ini.get("pipeline", "workers").has_value());
        }
    }
}

SCENARIO("Typed configuration from ini")
{
    GIVEN("A file overriding some keys of both threshold sets")
    {
        IniFile ini = iniFrom(
            "[activity_filter]\n"
            "person_conf_threshold = 0.4\n"
            "min_person_frames = 12\n"
            "[event_detector]\n"
            "conf_threshold = 0.6\n"
            "max_bbox_area = 90000\n"
            "max_gap_frames = 45\n"
            "require_motion_for_event = true\n"
            "unknown_key = whatever\n"
            "[pipeline]\n"
            "workers = 3\n");

        WHEN("typed")
        {
            PipelineConfig cfg = config_from_ini(ini);

            THEN("the two gates are configured independently")
            {
                CHECK(cfg.activity.gate.conf_threshold == doctest::Approx(0.4));
                CHECK(cfg.detector.gate.conf_threshold == doctest::Approx(0.6));
                CHECK(cfg.detector.gate.max_bbox_area == doctest::Approx(90000.0));
                CHECK(cfg.activity.gate.max_bbox_area == doctest::Approx(500000.0));
            }

            THEN("missing keys keep their defaults")
            {
                CHECK(cfg.activity.min_person_frames == 12);
                CHECK(cfg.detector.min_track_length == 15);
                CHECK(cfg.detector.min_event_duration_seconds == doctest::Approx(1.0));
                REQUIRE(cfg.detector.max_gap_frames.has_value());
                CHECK(*cfg.detector.max_gap_frames == 45);
                CHECK(cfg.detector.require_motion_for_event);
                CHECK(cfg.workers == 3);
                CHECK_NOTHROW(cfg.validate());
            }
        }
    }

    GIVEN("max_gap_frames = auto")
    {
        PipelineConfig cfg = config_from_ini(iniFrom("[event_detector]\nmax_gap_frames = auto\n"));
        CHECK_FALSE(cfg.detector.max_gap_frames.has_value());
    }

    GIVEN("A value that is not a number")
    {
        IniFile ini = iniFrom("[event_detector]\nmin_track_length = 15x\n");
        CHECK_THROWS_AS(config_from_ini(ini), std::invalid_argument);
    }

    GIVEN("A value that is not a boolean")
    {
        IniFile ini = iniFrom("[event_detector]\nrequire_motion_for_event = maybe\n");
        CHECK_THROWS_AS(config_from_ini(ini), std::invalid_argument);
    }

    GIVEN("Inconsistent bbox bounds")
    {
        PipelineConfig cfg = config_from_ini(iniFrom(
            "[activity_filter]\nmin_bbox_area = 9000\nmax_bbox_area = 100\n"));

        THEN("validation fails at load time")
        {
            CHECK_THROWS_AS(cfg.validate(), std::invalid_argument);
        }
    }

    GIVEN("Zero workers")
    {
        PipelineConfig cfg = config_from_ini(iniFrom("[pipeline]\nworkers = 0\n"));
        CHECK_THROWS_AS(cfg.validate(), std::invalid_argument);
    }

    GIVEN("A config path that does not exist")
    {
        CHECK_THROWS_AS(load_config("/nonexistent/event_gate.ini"), std::runtime_error);
    }
}
