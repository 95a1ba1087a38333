#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

// Normalize a time representation to seconds.
// Accepts plain seconds ("12.5", "12.5s", "12 secs"), MM:SS, HH:MM:SS,
// HH:MM:SS:hh and dotted codes with two or more dots ("10.56.39.32").
// The fourth component is hundredths: "0:0:1:50" is 1.5s, not 1.05s.
std::optional<double> parse_time_string(const std::string& raw);

// Numbers pass through; strings go through parse_time_string; anything else is unparseable.
std::optional<double> parse_time_value(const nlohmann::json& value);
