#include "core/config/json_loader.hpp"
#include "core/catalog/reference_catalog.hpp"
#include "core/common/resource_reference.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

#include <regex>

namespace rrkit
{

namespace
{

constexpr char literal_marker = '\x01';

auto read_file(const std::filesystem::path &path, std::string &out) -> bool
{
  std::ifstream f(path);
  if (!f.is_open())
    return false;
  std::stringstream buffer;
  buffer << f.rdbuf();
  out = buffer.str();
  return true;
}

auto parse_definition(const nlohmann::json &entry) -> reference_definition_t
{
  reference_definition_t def;

  if (entry.contains("uri"))
  {
    // Throws invalid_format_error, reported by the caller
    def.reference = resource_reference_t::of(entry["uri"].get<std::string>());
  }
  else
  {
    if (!entry.contains("environment") || !entry.contains("application") || !entry.contains("customer"))
    {
      throw std::runtime_error("entry needs either 'uri' or 'environment', 'application' and 'customer'");
    }

    // Explicit components are taken as given, the same as any other builder caller
    resource_reference_t::builder_t builder(entry["application"].get<std::string>(),
                                            entry["environment"].get<std::string>(),
                                            entry["customer"].get<std::string>());
    if (entry.contains("properties"))
    {
      builder.with_properties(entry["properties"].get<std::vector<std::string>>());
    }
    def.reference = builder.build();
  }

  def.description = entry.value("description", "");

  if (entry.contains("attributes"))
  {
    for (const auto &[key, val] : entry["attributes"].items())
    {
      def.attributes[key] = val.is_string() ? val.get<std::string>() : val.dump();
    }
  }

  return def;
}

} // namespace

auto json_loader_t::standardize_json(const std::string &input) -> std::string
{
  // 1. Strip single-line comments and swap string literals for numbered placeholders,
  //    so the passes below only ever see the document structure
  std::vector<std::string> literals;
  std::string result;
  result.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i)
  {
    if (input[i] == '"')
    {
      size_t end = i + 1;
      while (end < input.size() && input[end] != '"')
        end += (input[end] == '\\') ? 2 : 1;

      result += '"';
      result += literal_marker;
      result += std::to_string(literals.size());
      result += literal_marker;
      result += '"';
      literals.push_back(input.substr(i, end - i + 1));
      i = end;
    }
    else if (input.compare(i, 2, "//") == 0)
    {
      size_t eol = input.find('\n', i);
      if (eol == std::string::npos)
        break;
      i = eol - 1;
    }
    else if (input[i] != literal_marker)
    {
      result += input[i];
    }
  }

  // 2. Fix trailing commas before closing braces/brackets
  result = std::regex_replace(result, std::regex(",\\s*([}\\]])"), "$1");

  // 3. Quote unquoted keys
  result = std::regex_replace(result, std::regex("([{,])\\s*([a-zA-Z_][a-zA-Z0-9_]*)\\s*:"), "$1\"$2\":");
  result = std::regex_replace(result, std::regex("(^|\\n)\\s*([a-zA-Z_][a-zA-Z0-9_]*)\\s*:"), "$1\"$2\":");

  // 4. Put the string literals back
  std::string output;
  output.reserve(input.size());
  size_t pos = 0;
  while (true)
  {
    size_t start = result.find(literal_marker, pos);
    if (start == std::string::npos)
    {
      output.append(result, pos, std::string::npos);
      break;
    }
    size_t close = result.find(literal_marker, start + 1);
    // start and close each sit inside the placeholder's quotes
    output.append(result, pos, start - 1 - pos);
    output += literals[std::stoul(result.substr(start + 1, close - start - 1))];
    pos = close + 2;
  }

  return output;
}

auto json_loader_t::parse_catalog(const std::string &json_content, const std::string &source_name,
                                  reference_catalog_t &catalog) -> std::size_t
{
  nlohmann::json j;
  try
  {
    j = nlohmann::json::parse(standardize_json(json_content), nullptr, true, true);
  }
  catch (const std::exception &e)
  {
    std::cerr << "JSON Parse Error in " << source_name << ": " << e.what() << std::endl;
    return 0;
  }

  if (!j.is_object() || !j.contains("references") || !j["references"].is_array())
  {
    std::cerr << "Warning: " << source_name << " has no 'references' array" << std::endl;
    return 0;
  }

  std::size_t registered = 0;
  std::size_t index = 0;
  for (const auto &entry : j["references"])
  {
    try
    {
      catalog.register_reference(parse_definition(entry));
      ++registered;
    }
    catch (const std::exception &e)
    {
      std::cerr << "Failed to load reference #" << index << " from " << source_name << ": " << e.what()
                << std::endl;
    }
    ++index;
  }

  return registered;
}

auto json_loader_t::load_catalog_from_file(const std::string &file_path, reference_catalog_t &catalog)
    -> std::size_t
{
  if (!std::filesystem::exists(file_path))
  {
    std::cerr << "Warning: Catalog file not found: " << file_path << std::endl;
    return 0;
  }

  std::string content;
  if (!read_file(file_path, content))
  {
    std::cerr << "Failed to open catalog file: " << file_path << std::endl;
    return 0;
  }

  return parse_catalog(content, file_path, catalog);
}

auto json_loader_t::load_catalog_from_directory(const std::string &directory_path, reference_catalog_t &catalog)
    -> std::size_t
{
  if (!std::filesystem::exists(directory_path))
  {
    std::cerr << "Warning: Catalog directory not found: " << directory_path << std::endl;
    return 0;
  }

  std::size_t registered = 0;
  for (const auto &entry : std::filesystem::recursive_directory_iterator(directory_path))
  {
    if (entry.is_regular_file() && entry.path().extension() == ".json")
    {
      registered += load_catalog_from_file(entry.path().string(), catalog);
    }
  }
  return registered;
}

} // namespace rrkit
