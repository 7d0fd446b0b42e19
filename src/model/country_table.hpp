#pragma once

/// @file country_table.hpp
/// @brief Immutable country name -> land area (km²) reference table

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace contextviz {

/// One row of the reference table
struct CountryArea {
    std::string name;
    double area_km2 = 0.0;
};

/// Read-only lookup over the static country table. Built once on first use
/// and shared by every caller without locking.
class CountryTable {
  public:
    /// Builds a table from explicit entries.
    /// @throws std::invalid_argument on a duplicate name
    explicit CountryTable(const std::vector<CountryArea>& entries);

    /// The application's built-in table
    static const CountryTable& instance();

    /// True if `name` exactly matches a table key (case-sensitive)
    [[nodiscard]] bool contains(std::string_view name) const;

    /// Land area in km².
    /// @throws std::out_of_range if the name is not in the table
    [[nodiscard]] double area_km2(std::string_view name) const;

    /// All names in ascending order
    [[nodiscard]] const std::vector<std::string>& sorted_names() const { return sorted_names_; }

    /// Names starting with `prefix`, compared case-insensitively. An empty
    /// prefix returns every name.
    [[nodiscard]] std::vector<std::string> filter_by_prefix(std::string_view prefix) const;

    [[nodiscard]] size_t size() const { return areas_.size(); }

  private:
    std::map<std::string, double> areas_;
    std::vector<std::string> sorted_names_;
};

} // namespace contextviz
