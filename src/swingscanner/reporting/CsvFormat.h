// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

namespace swingscanner::reporting
{
  // Double-quotes a field when it holds a comma, quote or newline.
  inline std::string quoteCsvField(const std::string& field)
  {
    if (field.find_first_of(",\"\n\r") == std::string::npos)
      return field;

    std::string quoted("\"");
    for (char c : field)
      {
	if (c == '"')
	  quoted += '"';
	quoted += c;
      }
    quoted += '"';
    return quoted;
  }

  inline std::string formatDecimal(double value, int precision = 2)
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
  }

  // Enough significant digits to read back as the same double.
  inline std::string formatExact(double value)
  {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
  }

  // Empty string for a missing value.
  inline std::string formatOptional(const std::optional<double>& value, int precision = 2)
  {
    return value ? formatDecimal(*value, precision) : std::string();
  }

} // namespace swingscanner::reporting
