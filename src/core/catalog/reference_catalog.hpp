#pragma once

#include "core/common/resource_reference.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rrkit
{

/**
 * @brief Describes a single catalogued resource reference.
 */
struct reference_definition_t
{
  resource_reference_t reference;
  std::string description; // e.g. "Monthly invoices for acme"

  // Free-form metadata from the config file, e.g. "owner" -> "billing-team"
  std::map<std::string, std::string> attributes;
};

/**
 * @brief Registry of reference definitions, ordered by reference.
 */
class reference_catalog_t
{
public:
  reference_catalog_t() = default;

  // Replaces any existing definition for the same reference
  auto register_reference(const reference_definition_t &definition) -> void;

  auto get_reference(const resource_reference_t &reference) const -> const reference_definition_t *;
  auto contains(const resource_reference_t &reference) const -> bool;
  auto get_all_references() const -> const std::map<resource_reference_t, reference_definition_t> &;

  auto find_by_customer(std::string_view customer) const -> std::vector<const reference_definition_t *>;
  auto find_by_application(std::string_view application) const
      -> std::vector<const reference_definition_t *>;

  auto size() const -> std::size_t;
  auto clear() -> void;

private:
  std::map<resource_reference_t, reference_definition_t> m_reference_map;
};

} // namespace rrkit
