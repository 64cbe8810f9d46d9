#include <subscan/session.hpp>

#include <subscan/log.hpp>

#include <utility>

namespace subscan {

inline auto to_string(session_state s) noexcept -> std::string_view {
  switch (s) {
    case session_state::awaiting_domain:
      return "awaiting_domain";
    case session_state::awaiting_mode:
      return "awaiting_mode";
    case session_state::awaiting_confirmation:
      return "awaiting_confirmation";
    case session_state::scanning:
      return "scanning";
    case session_state::finished:
      return "finished";
  }
  return "unknown";
}

inline auto scan_session::submit_domain(std::string_view text) -> void_result {
  if (state_ != session_state::awaiting_domain) {
    return fail(error::invalid_state);
  }
  auto d = domain::parse(text);
  if (!d) {
    return fail(d.error());
  }
  target_.emplace(std::move(*d));
  state_ = session_state::awaiting_mode;
  return ok();
}

inline auto scan_session::select_mode(mode m) -> void_result {
  if (state_ != session_state::awaiting_mode) {
    return fail(error::invalid_state);
  }
  mode_ = m;
  state_ = session_state::awaiting_confirmation;
  return ok();
}

inline auto scan_session::confirm(bool quick) -> io_result<scan_request> {
  if (state_ != session_state::awaiting_confirmation) {
    return unexpected(make_error_code(error::invalid_state));
  }
  state_ = session_state::scanning;
  log_debug("session: scanning {} in {} mode", target_->str(), to_string(*mode_));
  return scan_request{*target_, *mode_, quick ? quick_config(*mode_) : config_for(*mode_)};
}

inline auto scan_session::complete(scan_result r) -> void_result {
  if (state_ != session_state::scanning) {
    return fail(error::invalid_state);
  }
  result_.emplace(std::move(r));
  state_ = session_state::finished;
  return ok();
}

inline void scan_session::reset() noexcept {
  state_ = session_state::awaiting_domain;
  target_.reset();
  mode_.reset();
  result_.reset();
}

}  // namespace subscan
