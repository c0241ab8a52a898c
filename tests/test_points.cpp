#include <catch2/catch.hpp>
#include <sstream>
#include <string>
#include <paddock/points.hpp>

using namespace paddock;

static ResultSnapshot snapshot_of(std::uint32_t version, std::vector<ResultEntry> entries) {
  ResultSnapshot s;
  s.session = 4;
  s.basis = Basis::official;
  s.version = version;
  s.entries = std::move(entries);
  return s;
}

static ResultEntry entry(CompetitorId id, std::string number, int pos,
                         ResultStatus status = ResultStatus::classified, bool eligible = true) {
  ResultEntry e;
  e.competitor = id;
  e.number = std::move(number);
  e.position = pos;
  e.status = status;
  e.points_eligible = eligible;
  e.total_laps = eligible ? 10 : 0;
  return e;
}

TEST_CASE("PointsScale lookup") {
  const auto s = make_points_scale("sprint", {25, 18, 15});
  REQUIRE(s.field_size == 3);
  REQUIRE(s.points_for(1) == 25);
  REQUIRE(s.points_for(3) == 15);
  REQUIRE(s.points_for(4) == 0);
  REQUIRE(s.points_for(0) == 0);

  SECTION("field size limits scored positions") {
    auto limited = s;
    limited.field_size = 2;
    REQUIRE(limited.points_for(3) == 0);
  }
}

TEST_CASE("compute_points tags entries with the snapshot version") {
  const auto snap = snapshot_of(7, {
    entry(1, "A", 1),
    entry(2, "B", 2),
    entry(3, "C", 3, ResultStatus::classified, false),
    entry(4, "D", 4, ResultStatus::disqualified, false),
  });
  const auto scale = make_points_scale("sprint", {25, 18, 15, 12});
  const auto table = compute_points(snap, scale);
  REQUIRE(table.size() == 4);
  for (const auto& p : table) {
    REQUIRE(p.version == 7);
    REQUIRE(p.session == 4);
    REQUIRE(p.scheme == "sprint");
  }
  REQUIRE(table[0].points == 25);
  REQUIRE(table[1].points == 18);
  REQUIRE(table[2].points == 0);  // no laps
  REQUIRE(table[3].points == 0);  // disqualified
  REQUIRE(table[3].position == 4);
}

TEST_CASE("compute_points with the two-place scale") {
  const auto snap = snapshot_of(1, {entry(1, "A", 1), entry(2, "B", 2), entry(3, "C", 3)});
  PointsScale scale;
  scale.scheme = "pair";
  scale.field_size = 2;
  scale.points = {{1, 25}, {2, 18}};
  const auto table = compute_points(snap, scale);
  REQUIRE(table[0].points == 25);
  REQUIRE(table[1].points == 18);
  REQUIRE(table[2].points == 0);
}

static std::string csv_minimal = R"(position,points
1,25
2,18
3,15
)";

static std::string csv_with_noise = R"(# heat scale
scheme = SN28 Heat
field_size = 2
 position , points
1 , 25
two, 20
, ,
2, 18
3, 15
)";

TEST_CASE("points_scale_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  const auto s = points_scale_from_csv_stream(ss);
  REQUIRE(s.field_size == 3);
  REQUIRE(s.points_for(2) == 18);
  REQUIRE(s.scheme.empty());
}

TEST_CASE("points_scale_from_csv_stream handles directives, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  const auto s = points_scale_from_csv_stream(ss);
  REQUIRE(s.scheme == "SN28 Heat");
  REQUIRE(s.field_size == 2);
  REQUIRE(s.points.size() == 3);
  REQUIRE(s.points_for(2) == 18);
  REQUIRE(s.points_for(3) == 0);
}

TEST_CASE("load_points_scale_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_points_scale_csv("this_file_does_not_exist.csv").has_value());
}
