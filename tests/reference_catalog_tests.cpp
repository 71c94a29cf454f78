#include "core/catalog/reference_catalog.hpp"
#include "core/common/resource_reference.hpp"
#include "test_harness.hpp"

#include <string>

namespace
{
using rrkit::reference_catalog_t;
using rrkit::reference_definition_t;
using rrkit::resource_reference_t;
using rrkit::test::expect_equal;
using rrkit::test::expect_true;

reference_definition_t make_definition(const std::string &uri, const std::string &description)
{
  reference_definition_t def;
  def.reference = resource_reference_t::of(uri);
  def.description = description;
  return def;
}

bool EmptyCatalogHasNothing()
{
  reference_catalog_t catalog;
  auto ref = resource_reference_t::of("rr://US/app/cust123");
  bool ok = expect_equal(catalog.size(), std::size_t(0), "empty size");
  ok &= expect_true(catalog.get_reference(ref) == nullptr, "lookup misses");
  ok &= expect_true(!catalog.contains(ref), "contains is false");
  ok &= expect_true(catalog.find_by_customer("cust123").empty(), "customer query empty");
  return ok;
}

bool RegisterAndLookup()
{
  reference_catalog_t catalog;
  catalog.register_reference(make_definition("rr://PRD/billing/acme/invoice", "Invoices"));

  const auto *def = catalog.get_reference(resource_reference_t::of("rr://PRD/billing/acme/invoice"));
  bool ok = expect_true(def != nullptr, "registered reference found");
  if (def != nullptr)
  {
    ok &= expect_equal(def->description, "Invoices", "description kept");
  }

  // Builder-made reference with equal components is the same key
  auto built = resource_reference_t::builder_t("Billing", "prd", "acme").add_property("invoice").build();
  ok &= expect_true(catalog.contains(built), "lookup by equal built reference");
  ok &= expect_true(!catalog.contains(resource_reference_t::of("rr://PRD/billing/acme")), "properties are part of the key");
  return ok;
}

bool RegisterReplacesExisting()
{
  reference_catalog_t catalog;
  catalog.register_reference(make_definition("rr://PRD/billing/acme/invoice", "first"));
  catalog.register_reference(make_definition("rr://PRD/billing/acme/invoice", "second"));

  bool ok = expect_equal(catalog.size(), std::size_t(1), "one entry per reference");
  ok &= expect_equal(catalog.get_all_references().begin()->second.description, "second", "last write wins");
  return ok;
}

bool QueriesFilterByComponent()
{
  reference_catalog_t catalog;
  catalog.register_reference(make_definition("rr://PRD/billing/acme/invoice", "a"));
  catalog.register_reference(make_definition("rr://DEV/billing/acme", "b"));
  catalog.register_reference(make_definition("rr://PRD/crm/globex", "c"));
  catalog.register_reference(make_definition("rr://PRD/crm/Acme", "d"));

  bool ok = expect_equal(catalog.find_by_customer("acme").size(), std::size_t(2), "customer is case sensitive");
  ok &= expect_equal(catalog.find_by_application("billing").size(), std::size_t(2), "billing entries");
  ok &= expect_equal(catalog.find_by_application("CRM").size(), std::size_t(2), "application query is lowered");
  ok &= expect_true(catalog.find_by_application("hr").empty(), "unknown application");

  // Ordered by environment first, so DEV comes before PRD
  auto results = catalog.find_by_customer("acme");
  ok &= expect_equal(results.front()->description, "b", "results follow catalog order");
  return ok;
}

bool ClearEmptiesCatalog()
{
  reference_catalog_t catalog;
  catalog.register_reference(make_definition("rr://PRD/billing/acme", "a"));
  catalog.clear();
  bool ok = expect_equal(catalog.size(), std::size_t(0), "cleared");
  ok &= expect_true(catalog.get_all_references().empty(), "map empty");
  return ok;
}

} // namespace

int main()
{
  return rrkit::test::run_tests({
      {"EmptyCatalogHasNothing", EmptyCatalogHasNothing},
      {"RegisterAndLookup", RegisterAndLookup},
      {"RegisterReplacesExisting", RegisterReplacesExisting},
      {"QueriesFilterByComponent", QueriesFilterByComponent},
      {"ClearEmptiesCatalog", ClearEmptiesCatalog},
  });
}
