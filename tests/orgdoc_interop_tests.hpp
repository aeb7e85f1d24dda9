#ifndef ORGDOC_TESTS_INTEROP__
#define ORGDOC_TESTS_INTEROP__

#include "orgdoc_test_harness.hpp"
#include "../include/orgdoc_interop.hpp"
#include "../include/orgdoc_document.hpp"

namespace orgdoc::tests
{
//------------------------------------------
// TESTS
//------------------------------------------

static bool interop_date_range_endpoints()
{
    using namespace std::chrono;

    auto doc = parse("<2024-03-15 Fri 10:30>--<2024-03-16 Sat 12:00>\n");
    auto ts = doc.first_node<timestamp_view>();
    EXPECT(ts.has_value(), "no timestamp");

    auto start = interop::to_year_month_day(*ts);
    EXPECT(start && *start == year_month_day{ year(2024), month(3), day(15) }, "wrong start date");

    auto end = interop::to_year_month_day(*ts, interop::endpoint::end);
    EXPECT(end && *end == year_month_day{ year(2024), month(3), day(16) }, "wrong end date");

    auto s = interop::to_sys_seconds(*ts);
    EXPECT(s && *s == sys_days(year(2024) / 3 / 15) + hours(10) + minutes(30), "wrong start time");

    auto e = interop::to_sys_seconds(*ts, interop::endpoint::end);
    EXPECT(e && *e == sys_days(year(2024) / 3 / 16) + hours(12), "wrong end time");
    return true;
}

static bool interop_time_range_shares_date()
{
    using namespace std::chrono;

    auto doc = parse("<2024-03-15 Fri 10:00-11:30>\n");
    auto ts = doc.first_node<timestamp_view>();
    EXPECT(ts.has_value(), "no timestamp");

    auto e = interop::to_sys_seconds(*ts, interop::endpoint::end);
    EXPECT(e && *e == sys_days(year(2024) / 3 / 15) + hours(11) + minutes(30), "wrong end of time range");
    return true;
}

static bool interop_date_only_is_midnight()
{
    using namespace std::chrono;

    auto doc = parse("[2023-12-31 Sun]\n");
    auto ts = doc.first_node<timestamp_view>();
    EXPECT(ts.has_value(), "no timestamp");

    auto s = interop::to_sys_seconds(*ts);
    EXPECT(s && *s == sys_days(year(2023) / 12 / 31), "date not at midnight");
    return true;
}

static bool interop_diary_has_no_date()
{
    auto doc = parse("<%%(diary-float t 4 2)>\n");
    auto ts = doc.first_node<timestamp_view>();
    EXPECT(ts && ts->is_diary(), "no diary timestamp");
    EXPECT(!interop::to_year_month_day(*ts).has_value(), "diary produced a date");
    EXPECT(!interop::to_sys_seconds(*ts).has_value(), "diary produced a time");
    return true;
}

static bool interop_clock_duration()
{
    using namespace std::chrono;

    auto doc = parse("CLOCK: [2024-01-01 Mon 10:00]--[2024-01-01 Mon 11:30] =>  1:30\nCLOCK: [2024-01-02 Tue 09:00]\n");
    auto clocks = doc.find_nodes<clock_view>();
    EXPECT(clocks.size() == 2, "wrong clock count");

    auto d = interop::to_duration(clocks[0]);
    EXPECT(d && *d == minutes(90), "wrong duration");
    EXPECT(!interop::to_duration(clocks[1]).has_value(), "running clock has a duration");
    return true;
}

static bool interop_property_containers()
{
    auto doc = parse("* h\n:PROPERTIES:\n:b: 2\n:A: 1\n:B+: 3\n:END:\n");
    auto props = doc.first_node<property_drawer_view>();
    EXPECT(props.has_value(), "no property drawer");

    auto v = interop::to_vector(*props);
    EXPECT(v.size() == 3, "wrong entry count");
    EXPECT(v[0].first == "b" && v[0].second == "2", "first entry wrong");
    EXPECT(v[2].first == "B" && v[2].second == "3", "append entry wrong");

    auto m = interop::to_map(*props);
    EXPECT(m.size() == 2, "keys not merged");
    EXPECT(m["A"] == "1", "wrong A");
    EXPECT(m["B"] == "2 3", "append not joined");
    return true;
}

    inline void run_interop_tests()
    {
        SUBCAT("Chrono");
        RUN_TEST(interop_date_range_endpoints);
        RUN_TEST(interop_time_range_shares_date);
        RUN_TEST(interop_date_only_is_midnight);
        RUN_TEST(interop_diary_has_no_date);
        RUN_TEST(interop_clock_duration);

        SUBCAT("Properties");
        RUN_TEST(interop_property_containers);
    }

} // ns orgdoc::tests

#endif
