#pragma once
#include <string>
#include <system_error>
#include <type_traits>
#include <boost/outcome/result.hpp>

namespace paddock {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

enum class errc {
  malformed_packet = 1,
  unknown_session,
  unknown_competitor,
  no_provisional_data,
  concurrent_publish,
  invalid_penalty_params,
  unknown_version,
  no_official_result,
  not_official,
  session_exists,
};

const std::error_category& error_category() noexcept;

inline std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

// Fallible operations return a value or a std::error_code in paddock's category.
template <class T>
using Result = outcome::result<T, std::error_code>;

} // namespace paddock

namespace std {
template <>
struct is_error_code_enum<paddock::errc> : true_type {};
} // namespace std
