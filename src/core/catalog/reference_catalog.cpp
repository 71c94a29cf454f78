#include "core/catalog/reference_catalog.hpp"

#include <algorithm>
#include <cctype>

namespace rrkit {

auto reference_catalog_t::register_reference(const reference_definition_t &definition)
    -> void {
  m_reference_map[definition.reference] = definition;
}

auto reference_catalog_t::get_reference(const resource_reference_t &reference) const
    -> const reference_definition_t * {
  auto it = m_reference_map.find(reference);
  if (it != m_reference_map.end()) {
    return &it->second;
  }
  return nullptr;
}

auto reference_catalog_t::contains(const resource_reference_t &reference) const
    -> bool {
  return m_reference_map.count(reference) != 0;
}

auto reference_catalog_t::get_all_references() const
    -> const std::map<resource_reference_t, reference_definition_t> & {
  return m_reference_map;
}

auto reference_catalog_t::find_by_customer(std::string_view customer) const
    -> std::vector<const reference_definition_t *> {
  std::vector<const reference_definition_t *> result;
  for (const auto &[ref, def] : m_reference_map) {
    if (ref.get_customer() == customer) {
      result.push_back(&def);
    }
  }
  return result;
}

auto reference_catalog_t::find_by_application(std::string_view application) const
    -> std::vector<const reference_definition_t *> {
  // Applications are stored lowercase
  std::string wanted(application);
  std::transform(wanted.begin(), wanted.end(), wanted.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::vector<const reference_definition_t *> result;
  for (const auto &[ref, def] : m_reference_map) {
    if (ref.get_application() == wanted) {
      result.push_back(&def);
    }
  }
  return result;
}

auto reference_catalog_t::size() const -> std::size_t { return m_reference_map.size(); }

auto reference_catalog_t::clear() -> void { m_reference_map.clear(); }

} // namespace rrkit
