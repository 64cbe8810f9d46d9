#include <subscan/generator.hpp>

#include <subscan/arrangement_cursor.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace subscan {

namespace detail {

inline constexpr auto normal_env_count = std::size_t{3};
inline constexpr auto ultimate_geo_env_count = std::size_t{4};
inline constexpr auto ultimate_role_env_count = std::size_t{3};

inline constexpr auto normal_numeric_roles = std::to_array<std::string_view>({"web", "app", "api"});
inline constexpr auto normal_numeric_suffixes =
  std::to_array<std::string_view>({"1", "2", "3", "01", "02"});

inline constexpr auto medium_numeric_roles =
  std::to_array<std::string_view>({"web", "app", "api", "server"});
inline constexpr int medium_numeric_max = 10;

inline constexpr auto ultimate_env_prefixes =
  std::to_array<std::string_view>({"", "www-", "web-", "app-", "api-"});
inline constexpr auto ultimate_env_suffixes = std::to_array<std::string_view>({"", "1", "2", "3"});
inline constexpr auto ultimate_cross_roles =
  std::to_array<std::string_view>({"app", "web", "api", "service"});
inline constexpr auto ultimate_cross_suffixes = std::to_array<std::string_view>({"", "1", "2"});
inline constexpr auto ultimate_numeric_roles =
  std::to_array<std::string_view>({"web", "app", "api", "server", "node", "host"});
inline constexpr int ultimate_numeric_max = 20;

// Appends `.<root>` to every label it is handed.
class candidate_sink {
 public:
  candidate_sink(candidate_set& out, std::string_view root) : out_(out), root_(root) {}

  void add(std::string_view label) {
    std::string name{};
    name.reserve(label.size() + 1 + root_.size());
    name.append(label);
    name.push_back('.');
    name.append(root_);
    out_.insert(std::move(name));
  }

  template <class Range>
  void add_all(Range const& labels) {
    for (std::string_view label : labels) {
      add(label);
    }
  }

 private:
  candidate_set& out_;
  std::string_view root_;
};

inline auto head(std::span<std::string_view const> list, std::size_t n)
  -> std::span<std::string_view const> {
  return list.first(std::min(n, list.size()));
}

inline void expand_normal(candidate_sink& sink, wordlists const& lists) {
  for (auto env : head(lists.environments, normal_env_count)) {
    sink.add(env);
    sink.add(fmt::format("{}-web", env));
  }

  for (auto num : normal_numeric_suffixes) {
    for (auto role : normal_numeric_roles) {
      sink.add(fmt::format("{}{}", role, num));
    }
  }
}

inline void expand_medium(candidate_sink& sink, wordlists const& lists) {
  for (auto env : lists.environments) {
    sink.add(env);
    sink.add(fmt::format("{}-web", env));
    sink.add(fmt::format("web-{}", env));
    sink.add(fmt::format("{}-app", env));
  }

  for (auto geo : lists.geo_codes) {
    sink.add(geo);
    sink.add(fmt::format("{}-web", geo));
    sink.add(fmt::format("www-{}", geo));
  }

  for (int i = 1; i <= medium_numeric_max; ++i) {
    for (auto role : medium_numeric_roles) {
      sink.add(fmt::format("{}{:02d}", role, i));
    }
  }
}

inline void expand_ultimate(candidate_sink& sink, wordlists const& lists, std::string_view root) {
  // Environment x prefix style x numeric variant, full cross product.
  for (auto env : lists.environments) {
    for (auto prefix : ultimate_env_prefixes) {
      for (auto num : ultimate_env_suffixes) {
        sink.add(fmt::format("{}{}{}", prefix, env, num));
      }
    }
  }

  for (auto geo : lists.geo_codes) {
    for (auto env : head(lists.environments, ultimate_geo_env_count)) {
      sink.add(fmt::format("{}-{}", geo, env));
      sink.add(fmt::format("{}-{}", env, geo));
    }
  }

  for (auto role : ultimate_cross_roles) {
    for (auto env : head(lists.environments, ultimate_role_env_count)) {
      for (auto num : ultimate_cross_suffixes) {
        sink.add(fmt::format("{}{}-{}", role, num, env));
      }
    }
  }

  for (int i = 1; i <= ultimate_numeric_max; ++i) {
    for (auto role : ultimate_numeric_roles) {
      sink.add(fmt::format("{}{:02d}", role, i));
      sink.add(fmt::format("{}-{:02d}", role, i));
    }
  }

  sink.add_all(lists.special);

  std::string flattened{root};
  std::replace(flattened.begin(), flattened.end(), '.', '-');
  sink.add(fmt::format("prod-{}", flattened));
}

inline void expand_word_combinations(candidate_sink& sink, wordlists const& lists,
                                     std::size_t max_size) {
  arrangement_cursor cursor{lists.combination_vocabulary, 2, max_size};
  while (cursor.next()) {
    sink.add(cursor.joined('-'));
  }
}

}  // namespace detail

inline auto candidate_generator::generate(domain const& d, mode m) const -> candidate_set {
  auto const root = d.without_www();

  candidate_set out{};
  detail::candidate_sink sink{out, root};

  sink.add_all(lists_.base);
  sink.add_all(lists_.dictionary);

  switch (m) {
    case mode::normal:
      detail::expand_normal(sink, lists_);
      break;
    case mode::medium:
      detail::expand_medium(sink, lists_);
      break;
    case mode::ultimate:
      detail::expand_ultimate(sink, lists_, root);
      break;
  }

  if (auto const k = max_arrangement_size(m); k >= 2) {
    detail::expand_word_combinations(sink, lists_, k);
  }
  return out;
}

inline auto candidate_generator::estimate_count(mode m) noexcept -> std::size_t {
  switch (m) {
    case mode::normal:
      return 50;
    case mode::medium:
      return 150;
    case mode::ultimate:
      return 500;
  }
  return 50;
}

inline auto candidate_generator::max_arrangement_size(mode m) noexcept -> std::size_t {
  switch (m) {
    case mode::normal:
      return 0;
    case mode::medium:
      return 2;
    case mode::ultimate:
      return 3;
  }
  return 0;
}

inline auto generate(domain const& d, mode m) -> candidate_set {
  return candidate_generator{}.generate(d, m);
}

}  // namespace subscan
