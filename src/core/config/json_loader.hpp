#pragma once

#include <cstddef>
#include <string>

namespace rrkit
{

// Forward declaration
class reference_catalog_t;

class json_loader_t
{
public:
  // Each returns the number of definitions registered into the catalog
  static auto load_catalog_from_file(const std::string &file_path, reference_catalog_t &catalog) -> std::size_t;
  static auto load_catalog_from_directory(const std::string &directory_path, reference_catalog_t &catalog)
      -> std::size_t;
  static auto parse_catalog(const std::string &json_content, const std::string &source_name,
                            reference_catalog_t &catalog) -> std::size_t;

  // Rewrites loose JSON (line comments, unquoted keys, trailing commas) into strict JSON
  static auto standardize_json(const std::string &input) -> std::string;
};

} // namespace rrkit
