#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace rrkit
{

/**
 * @brief Thrown by resource_reference_t::of when a string does not match the rr:// grammar.
 */
class invalid_format_error : public std::runtime_error
{
public:
  explicit invalid_format_error(std::string candidate);

  auto get_candidate() const -> const std::string &;

private:
  std::string m_candidate;
};

/**
 * @brief Structured identifier of the form
 *        rr://<ENV>/<app>/<customer>[/<prop>]{0,6}
 *
 * Instances are immutable. Environment is always stored uppercase and
 * application lowercase, whichever way the instance was created.
 */
class resource_reference_t
{
public:
  static constexpr std::string_view prefix = "rr://";
  static constexpr std::size_t max_properties = 6;

  class builder_t;

  resource_reference_t() = default;

  // Full-string match against the grammar. Never throws.
  static auto is_valid(std::string_view candidate) -> bool;
  static auto is_valid(const char *candidate) -> bool;

  // Throws invalid_format_error if the candidate does not match the grammar
  static auto of(std::string_view candidate) -> resource_reference_t;
  static auto try_parse(std::string_view candidate) -> std::optional<resource_reference_t>;

  auto get_environment() const -> const std::string &;
  auto get_application() const -> const std::string &;
  auto get_customer() const -> const std::string &;
  auto get_properties() const -> const std::vector<std::string> &;

  auto get_value() const -> std::string;
  auto to_string() const -> std::string;

  auto operator==(const resource_reference_t &other) const -> bool;
  auto operator!=(const resource_reference_t &other) const -> bool;
  auto operator<(const resource_reference_t &other) const -> bool;

  friend auto operator<<(std::ostream &os, const resource_reference_t &ref) -> std::ostream &;

private:
  resource_reference_t(std::string application, std::string environment, std::string customer,
                       std::vector<std::string> properties);

  std::string m_environment;
  std::string m_application;
  std::string m_customer;
  std::vector<std::string> m_properties;
};

/**
 * @brief Accumulates the parts of a reference and builds it.
 *
 * The builder does not check its input against the grammar, only
 * resource_reference_t::of does. A built reference can therefore format to
 * a string that is_valid rejects.
 */
class resource_reference_t::builder_t
{
public:
  builder_t(std::string_view application, std::string_view environment, std::string_view customer);

  template <typename... Props,
            std::enable_if_t<(std::is_convertible_v<Props, std::string_view> && ...), int> = 0>
  auto with_properties(Props &&...properties) -> builder_t &
  {
    (m_properties.emplace_back(std::forward<Props>(properties)), ...);
    return *this;
  }

  auto with_properties(const std::vector<std::string> &properties) -> builder_t &;
  auto add_property(std::string_view property) -> builder_t &;

  auto build() const -> resource_reference_t;

private:
  std::string m_application;
  std::string m_environment;
  std::string m_customer;
  std::vector<std::string> m_properties;
};

} // namespace rrkit
