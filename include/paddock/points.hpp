#pragma once
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <paddock/error.hpp>
#include <paddock/official.hpp>
#include <paddock/types.hpp>

namespace paddock {

// Finishing position -> points, with the number of scored positions.
struct PointsScale {
  std::string scheme;
  int field_size = 0;
  std::map<int, int> points;  // position (1-based) -> points

  // 0 for positions outside 1..field_size or missing from the map.
  int points_for(int position) const;
};

// Scale from a list where element i is the value for position i+1.
PointsScale make_points_scale(std::string scheme, const std::vector<int>& values);

struct PointsEntry {
  std::string scheme;
  std::uint32_t version = 0;  // equals the source snapshot's version
  SessionId session = 0;
  CompetitorId competitor = 0;
  std::string number;
  int position = 0;
  int points = 0;

  bool operator==(const PointsEntry&) const = default;
};

using PointsTable = std::vector<PointsEntry>;

// One entry per snapshot entry, in snapshot order. Disqualified and
// non-eligible competitors receive 0.
PointsTable compute_points(const ResultSnapshot& snapshot, const PointsScale& scale);

struct GridEntry {
  int slot = 0;  // 1-based starting position
  std::string number;
  std::string name;
  int total_points = 0;
  std::optional<int> qualifying_position;

  bool operator==(const GridEntry&) const = default;
};

// Sum heat points per competitor number, then order: points desc, official
// qualifying position asc (absent last), number in natural order.
// errc::not_official if any input is not an official snapshot.
Result<std::vector<GridEntry>> build_prefinal_grid(const std::vector<ResultSnapshot>& heats,
                                                   const ResultSnapshot* qualifying,
                                                   const PointsScale& scale);

// "2" < "10"; digit strings compare numerically, others lexically.
bool natural_less(const std::string& a, const std::string& b);

// CSV: "position,points" rows, optional header, '#' comments,
// "scheme=<name>" and "field_size=<n>" directives. Invalid rows are skipped.
PointsScale points_scale_from_csv_stream(std::istream& in);

// nullopt if the file cannot be opened.
std::optional<PointsScale> load_points_scale_csv(const std::string& path);

} // namespace paddock
