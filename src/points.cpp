#include <paddock/points.hpp>
#include <algorithm>
#include <fstream>
#include <tuple>
#include "text_util.hpp"

namespace paddock {

using detail::trim;

int PointsScale::points_for(int position) const {
  if (position < 1 || position > field_size) return 0;
  const auto it = points.find(position);
  return it == points.end() ? 0 : it->second;
}

PointsScale make_points_scale(std::string scheme, const std::vector<int>& values) {
  PointsScale s;
  s.scheme = std::move(scheme);
  s.field_size = static_cast<int>(values.size());
  for (std::size_t i = 0; i < values.size(); ++i) s.points[static_cast<int>(i) + 1] = values[i];
  return s;
}

PointsTable compute_points(const ResultSnapshot& snapshot, const PointsScale& scale) {
  PointsTable out;
  out.reserve(snapshot.entries.size());
  for (const auto& e : snapshot.entries) {
    PointsEntry p;
    p.scheme = scale.scheme;
    p.version = snapshot.version;
    p.session = snapshot.session;
    p.competitor = e.competitor;
    p.number = e.number;
    p.position = e.position;
    const bool scored = e.status == ResultStatus::classified && e.points_eligible;
    p.points = scored ? scale.points_for(e.position) : 0;
    out.push_back(std::move(p));
  }
  return out;
}

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); });
}

bool natural_less(const std::string& a, const std::string& b) {
  if (all_digits(a) && all_digits(b)) {
    const auto strip = [](const std::string& s) {
      const auto nz = s.find_first_not_of('0');
      return nz == std::string::npos ? std::string("0") : s.substr(nz);
    };
    const auto x = strip(a), y = strip(b);
    if (x.size() != y.size()) return x.size() < y.size();
    if (x != y) return x < y;
    return a < b;  // "07" vs "7"
  }
  return a < b;
}

Result<std::vector<GridEntry>> build_prefinal_grid(const std::vector<ResultSnapshot>& heats,
                                                   const ResultSnapshot* qualifying,
                                                   const PointsScale& scale) {
  for (const auto& h : heats)
    if (h.basis != Basis::official) return errc::not_official;
  if (qualifying && qualifying->basis != Basis::official) return errc::not_official;

  std::map<std::string, GridEntry> by_number;
  for (const auto& heat : heats) {
    for (const auto& p : compute_points(heat, scale)) {
      auto& g = by_number[p.number];
      g.number = p.number;
      g.total_points += p.points;
      if (g.name.empty()) {
        if (const auto* e = heat.find(p.competitor)) g.name = e->name;
      }
    }
  }
  if (qualifying) {
    for (auto& [number, g] : by_number) {
      const auto* e = qualifying->find_number(number);
      if (e && e->status == ResultStatus::classified) g.qualifying_position = e->position;
    }
  }

  std::vector<GridEntry> grid;
  grid.reserve(by_number.size());
  for (auto& [number, g] : by_number) grid.push_back(std::move(g));

  std::sort(grid.begin(), grid.end(), [](const GridEntry& a, const GridEntry& b) {
    if (a.total_points != b.total_points) return a.total_points > b.total_points;
    if (a.qualifying_position.has_value() != b.qualifying_position.has_value())
      return a.qualifying_position.has_value();
    if (a.qualifying_position && *a.qualifying_position != *b.qualifying_position)
      return *a.qualifying_position < *b.qualifying_position;
    return natural_less(a.number, b.number);
  });
  for (std::size_t i = 0; i < grid.size(); ++i) grid[i].slot = static_cast<int>(i) + 1;
  return grid;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && detail::lower(cols[0]) == "position";
}

PointsScale points_scale_from_csv_stream(std::istream& in) {
  PointsScale scale;
  std::optional<int> declared_field;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string_view raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    if (const auto eq = raw.find('='); eq != std::string_view::npos) {
      const auto key = detail::lower(trim(raw.substr(0, eq)));
      const auto value = trim(raw.substr(eq + 1));
      if (key == "scheme") scale.scheme = std::string(value);
      else if (key == "field_size") {
        if (auto n = detail::parse_int<int>(value); n && *n >= 0) declared_field = *n;
      }
      continue;
    }

    const auto cols = detail::split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2) continue;
    const auto pos = detail::parse_int<int>(cols[0]);
    const auto pts = detail::parse_int<int>(cols[1]);
    if (!pos || !pts || *pos < 1) continue;
    scale.points[*pos] = *pts;
  }

  if (declared_field) scale.field_size = *declared_field;
  else if (!scale.points.empty()) scale.field_size = scale.points.rbegin()->first;
  return scale;
}

std::optional<PointsScale> load_points_scale_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return points_scale_from_csv_stream(f);
}

} // namespace paddock
