#include "core/common/resource_reference.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace rrkit
{

namespace
{

auto is_upper_letter(char c) -> bool { return c >= 'A' && c <= 'Z'; }

auto is_lower_letter(char c) -> bool { return c >= 'a' && c <= 'z'; }

auto is_alnum_or_dash(char c) -> bool
{
  return is_upper_letter(c) || is_lower_letter(c) || (c >= '0' && c <= '9') || c == '-';
}

auto is_customer_char(char c) -> bool { return is_alnum_or_dash(c) || c == '_'; }

template <typename Pred>
auto segment_matches(std::string_view segment, std::size_t min_length, Pred pred) -> bool
{
  return segment.size() >= min_length && std::all_of(segment.begin(), segment.end(), pred);
}

auto split_segments(std::string_view path) -> std::vector<std::string_view>
{
  std::vector<std::string_view> segments;
  size_t start = 0;
  size_t slash_pos;
  while ((slash_pos = path.find('/', start)) != std::string_view::npos)
  {
    segments.push_back(path.substr(start, slash_pos - start));
    start = slash_pos + 1;
  }
  segments.push_back(path.substr(start));
  return segments;
}

auto to_upper(std::string_view input) -> std::string
{
  std::string result(input);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

auto to_lower(std::string_view input) -> std::string
{
  std::string result(input);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

} // namespace

invalid_format_error::invalid_format_error(std::string candidate)
    : std::runtime_error("Invalid resource reference: " + candidate), m_candidate(std::move(candidate))
{
}

auto invalid_format_error::get_candidate() const -> const std::string & { return m_candidate; }

resource_reference_t::resource_reference_t(std::string application, std::string environment,
                                           std::string customer, std::vector<std::string> properties)
    : m_environment(to_upper(environment)), m_application(to_lower(application)),
      m_customer(std::move(customer)), m_properties(std::move(properties))
{
}

auto resource_reference_t::is_valid(std::string_view candidate) -> bool
{
  return try_parse(candidate).has_value();
}

auto resource_reference_t::is_valid(const char *candidate) -> bool
{
  return candidate != nullptr && is_valid(std::string_view(candidate));
}

auto resource_reference_t::of(std::string_view candidate) -> resource_reference_t
{
  auto parsed = try_parse(candidate);
  if (!parsed)
  {
    throw invalid_format_error(std::string(candidate));
  }
  return std::move(*parsed);
}

auto resource_reference_t::try_parse(std::string_view candidate) -> std::optional<resource_reference_t>
{
  // rr://<ENV>/<app>/<customer>[/<prop>]{0,6}, plus a lone trailing slash when there are no properties
  if (candidate.substr(0, prefix.size()) != prefix)
    return std::nullopt;

  auto segments = split_segments(candidate.substr(prefix.size()));
  if (segments.size() == 4 && segments.back().empty())
    segments.pop_back();
  if (segments.size() < 3 || segments.size() > 3 + max_properties)
    return std::nullopt;

  if (!segment_matches(segments[0], 2, is_upper_letter) || !segment_matches(segments[1], 2, is_lower_letter) ||
      !segment_matches(segments[2], 3, is_customer_char))
    return std::nullopt;

  builder_t builder(segments[1], segments[0], segments[2]);
  for (size_t i = 3; i < segments.size(); ++i)
  {
    if (!segment_matches(segments[i], 2, is_alnum_or_dash))
      return std::nullopt;
    builder.add_property(segments[i]);
  }
  return builder.build();
}

auto resource_reference_t::get_environment() const -> const std::string & { return m_environment; }

auto resource_reference_t::get_application() const -> const std::string & { return m_application; }

auto resource_reference_t::get_customer() const -> const std::string & { return m_customer; }

auto resource_reference_t::get_properties() const -> const std::vector<std::string> &
{
  return m_properties;
}

auto resource_reference_t::get_value() const -> std::string
{
  std::string value(prefix);
  value += m_environment;
  value += '/';
  value += m_application;
  value += '/';
  value += m_customer;
  for (const auto &property : m_properties)
  {
    value += '/';
    value += property;
  }
  return value;
}

auto resource_reference_t::to_string() const -> std::string { return get_value(); }

auto resource_reference_t::operator==(const resource_reference_t &other) const -> bool
{
  return m_environment == other.m_environment && m_application == other.m_application &&
         m_customer == other.m_customer && m_properties == other.m_properties;
}

auto resource_reference_t::operator!=(const resource_reference_t &other) const -> bool
{
  return !(*this == other);
}

auto resource_reference_t::operator<(const resource_reference_t &other) const -> bool
{
  return std::tie(m_environment, m_application, m_customer, m_properties) <
         std::tie(other.m_environment, other.m_application, other.m_customer, other.m_properties);
}

auto operator<<(std::ostream &os, const resource_reference_t &ref) -> std::ostream &
{
  os << ref.get_value();
  return os;
}

resource_reference_t::builder_t::builder_t(std::string_view application, std::string_view environment,
                                           std::string_view customer)
    : m_application(to_lower(application)), m_environment(to_upper(environment)), m_customer(customer)
{
}

auto resource_reference_t::builder_t::with_properties(const std::vector<std::string> &properties)
    -> builder_t &
{
  m_properties.insert(m_properties.end(), properties.begin(), properties.end());
  return *this;
}

auto resource_reference_t::builder_t::add_property(std::string_view property) -> builder_t &
{
  m_properties.emplace_back(property);
  return *this;
}

auto resource_reference_t::builder_t::build() const -> resource_reference_t
{
  return resource_reference_t(m_application, m_environment, m_customer, m_properties);
}

} // namespace rrkit
