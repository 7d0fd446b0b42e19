/// @file form_validation.cpp
/// @brief Form field parsing and the user-facing validation messages

#include "model/form_validation.hpp"

#include "model/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace contextviz {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

/// strtod reads "0x1A" and "0x1p3"; decimal input is all the form accepts
bool is_hex_literal(std::string_view text) {
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        text.remove_prefix(1);
    }
    return text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

} // namespace

std::optional<double> parse_area(std::string_view text) {
    std::string trimmed(trim(text));
    if (trimmed.empty() || is_hex_literal(trimmed)) {
        return std::nullopt;
    }

    // Underflow yields 0 or a denormal, left for the positive-value check;
    // overflow yields infinity, rejected below
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

SpatialInput validate_spatial_form(const SpatialForm& form, const CountryTable& countries) {
    std::optional<double> house = parse_area(form.house_text);
    std::optional<double> city = parse_area(form.city_text);
    if (!house || !city) {
        throw InvalidInput("Please enter numeric area values");
    }
    if (*house <= 0.0 || *city <= 0.0) {
        throw InvalidInput("Please enter positive area values");
    }
    if (!countries.contains(form.country)) {
        throw InvalidInput("Please select a country-name from the dropdown list");
    }

    SpatialInput input;
    input.house = {*house, form.house_unit};
    input.city = {*city, form.city_unit};
    input.country = form.country;
    return input;
}

void validate_population_form(const PopulationForm& form) {
    if (!form.show_births && !form.show_deaths) {
        throw InvalidInput("Please select at least one visualization checkbox");
    }
}

} // namespace contextviz
