// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <stdexcept>
#include <string>

namespace swingscanner::screening
{
  /**
   * @brief Base class for per-instrument screening failures.
   *
   * None of these abort a scan: a gate converts them into a failed
   * GateResult for the affected instrument (or, for MissingFieldException,
   * into a failed signal).
   */
  class ScreeningException : public std::runtime_error
  {
  public:
    explicit ScreeningException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~ScreeningException() noexcept override = default;
  };

  // Series shorter than the window a gate needs.
  class InsufficientHistoryException : public ScreeningException
  {
  public:
    explicit InsufficientHistoryException(const std::string& msg)
      : ScreeningException(msg)
    {}
  };

  // A fundamental or institutional attribute is absent.
  class MissingFieldException : public ScreeningException
  {
  public:
    explicit MissingFieldException(const std::string& fieldName)
      : ScreeningException("missing field: " + fieldName),
	mFieldName(fieldName)
    {}

    const std::string& getFieldName() const
    {
      return mFieldName;
    }

  private:
    std::string mFieldName;
  };

  // Sector peer group too small or too uniform for a z-score.
  class DegenerateGroupException : public ScreeningException
  {
  public:
    explicit DegenerateGroupException(const std::string& msg)
      : ScreeningException(msg)
    {}
  };

  // Numeric failure such as division by zero.
  class ComputeException : public ScreeningException
  {
  public:
    explicit ComputeException(const std::string& msg)
      : ScreeningException(msg)
    {}
  };

} // namespace swingscanner::screening
