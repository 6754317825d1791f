// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <set>
#include <doctest/doctest.h>
#include <HeatGridDemo/Source/week_data.h>

using namespace heat;
using namespace hgd;


namespace
{
bool isSameDate(const wxDateTime& dt, int day, wxDateTime::Month month, int year)
{
    return dt.GetDay() == day && dt.GetMonth() == month && dt.GetYear() == year;
}
}


TEST_SUITE("demo.week_data") {
TEST_CASE("Week starts on Monday")
{
    const wxDateTime thursday(15, wxDateTime::Oct, 2026, 14, 30);
    const wxDateTime sunday  (18, wxDateTime::Oct, 2026);
    const wxDateTime monday  (12, wxDateTime::Oct, 2026, 8);

    CHECK(isSameDate(getWeekStart(thursday, 0), 12, wxDateTime::Oct, 2026));
    CHECK(isSameDate(getWeekStart(sunday,   0), 12, wxDateTime::Oct, 2026));
    CHECK(isSameDate(getWeekStart(monday,   0), 12, wxDateTime::Oct, 2026));

    CHECK_EQ(getWeekStart(thursday, 0).GetWeekDay(), wxDateTime::Mon);
    CHECK_EQ(getWeekStart(thursday, 0).GetHour(), 0);
}


TEST_CASE("Week offset navigates")
{
    const wxDateTime today(15, wxDateTime::Oct, 2026);

    CHECK(isSameDate(getWeekStart(today, -1), 5,  wxDateTime::Oct, 2026));
    CHECK(isSameDate(getWeekStart(today,  1), 19, wxDateTime::Oct, 2026));

    const wxDateTime newYear(1, wxDateTime::Jan, 2026); //Thursday
    CHECK(isSameDate(getWeekStart(newYear, 0), 29, wxDateTime::Dec, 2025));
}


TEST_CASE("Format week range")
{
    const wxDateTime weekStart(12, wxDateTime::Oct, 2026);

    CHECK_EQ(formatWeekRange(weekStart, DateFormat::monthDay), L"Oct 12 - Oct 18");
    CHECK_EQ(formatWeekRange(weekStart, DateFormat::numeric),  L"12.10.2026. - 18.10.2026.");

    const wxDateTime monthEnd(28, wxDateTime::Dec, 2026);
    CHECK_EQ(formatWeekRange(monthEnd, DateFormat::numeric), L"28.12.2026. - 03.01.2027.");
}


TEST_CASE("Activity rows stay in range")
{
    std::mt19937 rng(42);
    const std::vector<std::wstring> labels{L"Mon", L"Tue", L"Wed", L"Thu", L"Fri", L"Sat", L"Sun"};

    for (int i = 0; i < 20; ++i)
    {
        const std::vector<RowData> rows = generateActivityRows(labels, 12, 12, rng);
        REQUIRE_EQ(rows.size(), labels.size());

        for (size_t r = 0; r < rows.size(); ++r)
        {
            CHECK_EQ(rows[r].label, labels[r]);
            CHECK_GE(rows[r].cells.size(), 1u);
            CHECK_LE(rows[r].cells.size(), 12u);
            for (const auto& [idx, value] : rows[r].cells)
                CHECK_LE(idx, 12u);
        }
    }
}


TEST_CASE("Athletes train on distinct days")
{
    std::mt19937 rng(7);
    const std::vector<Athlete> athletes = generateAthletes({L"Pulse", L"Track", L"Lift"}, rng);
    REQUIRE_EQ(athletes.size(), 3u);
    CHECK_EQ(athletes[1].name, L"Track");

    for (const Athlete& a : athletes)
    {
        std::set<int> days;
        for (const Workout& w : a.workouts)
        {
            CHECK_GE(w.day, 1);
            CHECK_LE(w.day, 7);
            CHECK_GE(w.minutes, 10);
            CHECK_LE(w.minutes, maxWorkoutMinutes);
            CHECK(days.insert(w.day).second);
        }
    }
}


TEST_CASE("Workout color scale")
{
    CHECK_EQ(getWorkoutColor(0),                 wxColor(0x9b, 0xe9, 0xa8));
    CHECK_EQ(getWorkoutColor(maxWorkoutMinutes), wxColor(0x21, 0x6e, 0x39));
    CHECK_EQ(getWorkoutColor(-5),  getWorkoutColor(0));
    CHECK_EQ(getWorkoutColor(500), getWorkoutColor(maxWorkoutMinutes));

    //darker with more minutes
    CHECK_GT(getWorkoutColor(30).Green(), getWorkoutColor(90).Green());
}
}
