#include "core/catalog/reference_catalog.hpp"
#include "core/common/resource_reference.hpp"
#include "core/config/json_loader.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace
{

auto print_usage() -> void
{
  std::cerr << "Usage:\n"
            << "  rrtool validate <reference>...\n"
            << "  rrtool parse <reference>\n"
            << "  rrtool build <application> <environment> <customer> [property...]\n"
            << "  rrtool catalog <file-or-directory>\n";
}

auto run_validate(const std::vector<std::string> &args) -> int
{
  bool all_valid = true;
  for (const auto &arg : args)
  {
    bool valid = rrkit::resource_reference_t::is_valid(arg);
    std::cout << arg << ": " << (valid ? "valid" : "invalid") << std::endl;
    all_valid = all_valid && valid;
  }
  return all_valid ? 0 : 1;
}

auto run_parse(const std::string &candidate) -> int
{
  try
  {
    auto ref = rrkit::resource_reference_t::of(candidate);
    std::cout << ref << "\n"
              << "  environment: " << ref.get_environment() << "\n"
              << "  application: " << ref.get_application() << "\n"
              << "  customer:    " << ref.get_customer() << "\n"
              << "  properties:  " << ref.get_properties().size() << std::endl;
    for (const auto &property : ref.get_properties())
    {
      std::cout << "    - " << property << std::endl;
    }
    return 0;
  }
  catch (const rrkit::invalid_format_error &e)
  {
    std::cerr << e.what() << std::endl;
    return 1;
  }
}

auto run_build(const std::vector<std::string> &args) -> int
{
  rrkit::resource_reference_t::builder_t builder(args[0], args[1], args[2]);
  for (size_t i = 3; i < args.size(); ++i)
  {
    builder.add_property(args[i]);
  }

  auto ref = builder.build();
  std::cout << ref << std::endl;
  if (!rrkit::resource_reference_t::is_valid(ref.get_value()))
  {
    std::cerr << "Warning: built reference does not match the rr:// grammar" << std::endl;
  }
  return 0;
}

auto run_catalog(const std::string &path) -> int
{
  rrkit::reference_catalog_t catalog;

  std::cout << "Loading catalog from " << path << "..." << std::endl;
  if (std::filesystem::is_directory(path))
    rrkit::json_loader_t::load_catalog_from_directory(path, catalog);
  else
    rrkit::json_loader_t::load_catalog_from_file(path, catalog);

  std::cout << catalog.size() << " reference(s)" << std::endl;
  for (const auto &[ref, def] : catalog.get_all_references())
  {
    std::cout << "  " << ref;
    if (!def.description.empty())
      std::cout << "  " << def.description;
    std::cout << std::endl;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[])
{
  if (argc < 2)
  {
    print_usage();
    return 2;
  }

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  if (command == "validate" && !args.empty())
    return run_validate(args);
  if (command == "parse" && args.size() == 1)
    return run_parse(args[0]);
  if (command == "build" && args.size() >= 3)
    return run_build(args);
  if (command == "catalog" && args.size() == 1)
    return run_catalog(args[0]);

  print_usage();
  return 2;
}
