#pragma once

#include <subscan/domain.hpp>
#include <subscan/mode.hpp>
#include <subscan/result.hpp>
#include <subscan/scan_config.hpp>
#include <subscan/scan_result.hpp>

#include <optional>
#include <string_view>

namespace subscan {

enum class session_state {
  awaiting_domain,
  awaiting_mode,
  awaiting_confirmation,
  scanning,
  finished,
};

auto to_string(session_state s) noexcept -> std::string_view;

/// What the driving client hands to the generator and verifier on confirmation.
struct scan_request {
  domain target;
  mode selected;
  scan_config config;
};

/// Conversation state of one interactive client.
///
/// awaiting_domain -> awaiting_mode -> awaiting_confirmation -> scanning -> finished.
/// `reset()` returns to awaiting_domain from anywhere. The core is only invoked after
/// `confirm()` moved the session into `scanning`.
///
/// Events that do not fit the current state return `error::invalid_state` and leave the
/// session unchanged. A rejected domain keeps the session in awaiting_domain.
class scan_session {
 public:
  auto state() const noexcept -> session_state { return state_; }

  auto submit_domain(std::string_view text) -> void_result;
  auto select_mode(mode m) -> void_result;

  /// Enter `scanning` and return the request to run. `quick` selects `quick_config()`.
  auto confirm(bool quick = false) -> io_result<scan_request>;

  /// Record the verifier's result and enter `finished`.
  auto complete(scan_result r) -> void_result;

  void reset() noexcept;

  auto target() const noexcept -> std::optional<domain> const& { return target_; }
  auto selected_mode() const noexcept -> std::optional<mode> { return mode_; }
  auto result() const noexcept -> std::optional<scan_result> const& { return result_; }

 private:
  session_state state_ = session_state::awaiting_domain;
  std::optional<domain> target_{};
  std::optional<mode> mode_{};
  std::optional<scan_result> result_{};
};

}  // namespace subscan
