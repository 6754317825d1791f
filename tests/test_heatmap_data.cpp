// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <stdexcept>
#include <doctest/doctest.h>
#include <wx+/heatmap_data.h>

using namespace heat;


namespace
{
struct Activity
{
    int day   = 0; //1-based
    int count = 0;
};

struct User
{
    std::wstring name;
    std::vector<Activity> activities;
};
}


TEST_SUITE("heatmap.data") {
TEST_CASE("Index mapper places details")
{
    const std::vector<User> users{{L"Allen", {{1, 7000}, {3, 3000}}}};

    const std::vector<RowData> rows = bindRows(users,
                                               [](const User& u) { return u.name; },
                                               [](const User& u) { return u.activities; },
                                               [](const Activity& a) { return a.day - 1; });
    REQUIRE_EQ(rows.size(), 1u);
    CHECK_EQ(rows[0].label, L"Allen");
    REQUIRE_EQ(rows[0].cells.size(), 2u);
    CHECK_EQ(rows[0].cells.count(1), 0u);

    const Activity* a0 = cellValueAs<Activity>(&rows[0].cells.at(0));
    const Activity* a2 = cellValueAs<Activity>(&rows[0].cells.at(2));
    REQUIRE(a0);
    REQUIRE(a2);
    CHECK_EQ(a0->count, 7000);
    CHECK_EQ(a2->count, 3000);
}


TEST_CASE("Position is index without mapper")
{
    const std::vector<User> users{{L"Bob", {{5, 1}, {6, 2}, {7, 3}}}, {L"Carl", {}}};

    const std::vector<RowData> rows = bindRows(users,
                                               [](const User& u) { return u.name; },
                                               [](const User& u) { return u.activities; });
    REQUIRE_EQ(rows.size(), 2u);
    REQUIRE_EQ(rows[0].cells.size(), 3u);
    CHECK_EQ(cellValueAs<Activity>(&rows[0].cells.at(0))->day, 5);
    CHECK_EQ(cellValueAs<Activity>(&rows[0].cells.at(2))->day, 7);
    CHECK(rows[1].cells.empty());
}


TEST_CASE("Empty mapper falls back to position")
{
    const std::vector<User> users{{L"Bob", {{5, 1}, {6, 2}}}};

    const std::function<int(const Activity&)> noMapper;
    const std::vector<RowData> rows = bindRows(users,
                                               [](const User& u) { return u.name; },
                                               [](const User& u) { return u.activities; },
                                               noMapper);
    REQUIRE_EQ(rows[0].cells.size(), 2u);
    CHECK_EQ(cellValueAs<Activity>(&rows[0].cells.at(1))->day, 6);
}


TEST_CASE("Negative index is dropped")
{
    const std::vector<User> users{{L"Dan", {{0, 1}, {2, 2}}}};

    const std::vector<RowData> rows = bindRows(users,
                                               [](const User& u) { return u.name; },
                                               [](const User& u) { return u.activities; },
                                               [](const Activity& a) { return a.day - 1; });
    REQUIRE_EQ(rows[0].cells.size(), 1u);
    CHECK_EQ(rows[0].cells.count(1), 1u);
}


TEST_CASE("Later detail wins on same index")
{
    const std::vector<User> users{{L"Eve", {{4, 10}, {4, 20}}}};

    const std::vector<RowData> rows = bindRows(users,
                                               [](const User& u) { return u.name; },
                                               [](const User& u) { return u.activities; },
                                               [](const Activity& a) { return a.day; });
    REQUIRE_EQ(rows[0].cells.size(), 1u);
    CHECK_EQ(cellValueAs<Activity>(&rows[0].cells.at(4))->count, 20);
}


TEST_CASE("Index beyond columns is stored")
{
    const std::vector<User> users{{L"Fay", {{40, 1}}}};

    const std::vector<RowData> rows = bindRows(users,
                                               [](const User& u) { return u.name; },
                                               [](const User& u) { return u.activities; },
                                               [](const Activity& a) { return a.day; });
    CHECK_EQ(rows[0].cells.count(40), 1u);
}


TEST_CASE("Extractor exception propagates")
{
    const std::vector<User> users{{L"Gil", {{1, 1}}}};

    CHECK_THROWS_AS(bindRows(users,
                             [](const User& u) { return u.name; },
                             [](const User& u) { return u.activities; },
                             [](const Activity& a) -> int { throw std::runtime_error("bad detail"); }),
                    std::runtime_error);

    CHECK_THROWS_AS(bindRows(users,
                             [](const User& u) -> std::wstring { throw std::logic_error("bad label"); },
                             [](const User& u) { return u.activities; }),
                    std::logic_error);
}


TEST_CASE("Activity row is presence only")
{
    const RowData row = makeActivityRow(L"Mon", std::vector<int>{0, 3, -2, 11});

    CHECK_EQ(row.label, L"Mon");
    REQUIRE_EQ(row.cells.size(), 3u);
    CHECK_EQ(row.cells.count(0), 1u);
    CHECK_EQ(row.cells.count(3), 1u);
    CHECK_EQ(row.cells.count(11), 1u);
    CHECK_FALSE(row.cells.at(3).has_value());
}


TEST_CASE("Cell value as checks type")
{
    const CellValue value = Activity{2, 5};

    CHECK_NE(cellValueAs<Activity>(&value), nullptr);
    CHECK_EQ(cellValueAs<int>(&value), nullptr);
    CHECK_EQ(cellValueAs<Activity>(nullptr), nullptr);
}


TEST_CASE("Default headers are months")
{
    const std::vector<std::wstring> headers = getDefaultColumnHeaders();
    REQUIRE_EQ(headers.size(), 12u);
    CHECK_EQ(headers.front(), L"Jan");
    CHECK_EQ(headers.back(),  L"Dec");
}
}
