#include <paddock/error.hpp>

namespace paddock {

namespace {

class PaddockCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "paddock"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::malformed_packet:       return "malformed packet";
      case errc::unknown_session:        return "unknown session";
      case errc::unknown_competitor:     return "unknown competitor";
      case errc::no_provisional_data:    return "session has no laps";
      case errc::concurrent_publish:     return "another publish is in flight for this session";
      case errc::invalid_penalty_params: return "invalid penalty parameters";
      case errc::unknown_version:        return "unknown official version";
      case errc::no_official_result:     return "session has no official result";
      case errc::not_official:           return "snapshot is not official";
      case errc::session_exists:         return "session already exists";
    }
    return "unknown paddock error";
  }
};

} // namespace

const std::error_category& error_category() noexcept {
  static const PaddockCategory category;
  return category;
}

} // namespace paddock
