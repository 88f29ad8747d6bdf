// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SWING_TIMESERIES_EXCEPTION_H
#define __SWING_TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace swing_timeseries
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  class TimeSeriesDataAccessException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesDataAccessException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  class TimeSeriesDataNotFoundException : public TimeSeriesDataAccessException
  {
  public:
      explicit TimeSeriesDataNotFoundException(const std::string& msg)
        : TimeSeriesDataAccessException(msg) {}
  };

  class TimeSeriesOffsetOutOfRangeException : public TimeSeriesDataAccessException
  {
  public:
      explicit TimeSeriesOffsetOutOfRangeException(const std::string& msg)
        : TimeSeriesDataAccessException(msg) {}
  };

  // Raised by indicators when a series is shorter than the lookback they need.
  class InsufficientDataException : public TimeSeriesException
  {
  public:
    InsufficientDataException(const std::string& msg,
			      unsigned long required,
			      unsigned long available)
      : TimeSeriesException(msg),
	mRequired(required),
	mAvailable(available)
    {}

    unsigned long getRequired() const
    {
      return mRequired;
    }

    unsigned long getAvailable() const
    {
      return mAvailable;
    }

  private:
    unsigned long mRequired;
    unsigned long mAvailable;
  };

} // namespace swing_timeseries

#endif // __SWING_TIMESERIES_EXCEPTION_H
