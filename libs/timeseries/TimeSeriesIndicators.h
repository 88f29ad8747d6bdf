// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SWING_TIMESERIES_INDICATORS_H
#define __SWING_TIMESERIES_INDICATORS_H 1

#include <cmath>
#include <cstdint>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "TimeSeries.h"

namespace swing_timeseries
{
  using namespace boost::accumulators;

  namespace detail
  {
    inline void requireEntries (const std::string& indicator,
				unsigned long required,
				unsigned long available)
    {
      if (available < required)
	throw InsufficientDataException(indicator + ": requires " + std::to_string(required) +
					" entries, series has " + std::to_string(available),
					required,
					available);
    }

    // Monday of the week containing d.
    inline boost::gregorian::date weekStart (const boost::gregorian::date& d)
    {
      int offset = (static_cast<int>(d.day_of_week().as_number()) + 6) % 7;
      return d - boost::gregorian::days(offset);
    }
  }

  /**
   * @brief Arithmetic mean of a vector of values.
   *
   * @return The mean, or zero for an empty vector.
   */
  template <class Decimal>
  Decimal Mean (const std::vector<Decimal>& values)
  {
    if (values.empty())
      return Decimal(0);

    accumulator_set<double, features<tag::mean>> stats;
    for (const auto& v : values)
      stats(static_cast<double>(v));

    return Decimal(mean(stats));
  }

  /**
   * @brief Population standard deviation (divides by N) of a vector of values.
   *
   * Uses boost::accumulators to compute the variance.
   *
   * @return The standard deviation, or zero for an empty vector.
   */
  template <class Decimal>
  Decimal StandardDeviation (const std::vector<Decimal>& values)
  {
    if (values.empty())
      return Decimal(0);

    accumulator_set<double, features<tag::variance>> stats;
    for (const auto& v : values)
      stats(static_cast<double>(v));

    return Decimal(std::sqrt(variance(stats)));
  }

  /**
   * @brief Simple moving average series.
   *
   * The first value is dated at index (period - 1) of the input series.
   *
   * @throws InsufficientDataException if the series has fewer than period entries.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> SmaSeries (const NumericTimeSeries<Decimal>& series, uint32_t period)
  {
    if (period == 0)
      throw std::domain_error("SmaSeries: period must be positive");

    detail::requireEntries("SmaSeries", period, series.getNumEntries());

    std::vector<Decimal> values(series.getTimeSeriesAsVector());
    NumericTimeSeries<Decimal> result(series.getNumEntries() - period + 1);

    Decimal windowSum(0);
    for (uint32_t i = 0; i < period; ++i)
      windowSum += values[i];

    result.addEntry(series.getEntry(period - 1).getDateValue(), windowSum / Decimal(period));

    for (unsigned long i = period; i < values.size(); ++i)
      {
	windowSum += values[i] - values[i - period];
	result.addEntry(series.getEntry(i).getDateValue(), windowSum / Decimal(period));
      }

    return result;
  }

  /**
   * @brief Mean of (High - Low) / Close over the trailing window of sessions.
   *
   * @throws InsufficientDataException if the series is shorter than the window.
   * @throws std::domain_error if a close inside the window is not positive.
   */
  template <class Decimal>
  Decimal AverageRelativeRange (const OHLCTimeSeries<Decimal>& series, uint32_t window)
  {
    if (window == 0)
      throw std::domain_error("AverageRelativeRange: window must be positive");

    detail::requireEntries("AverageRelativeRange", window, series.getNumEntries());

    std::vector<Decimal> ranges;
    ranges.reserve(window);

    for (uint32_t offset = 0; offset < window; ++offset)
      {
	ranges.push_back(series.getEntryFromEnd(offset).getRelativeRange());
      }

    return Mean(ranges);
  }

  /**
   * @brief True range series. The first entry has no prior close and uses High - Low.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> TrueRangeSeries (const OHLCTimeSeries<Decimal>& series)
  {
    NumericTimeSeries<Decimal> result(series.getNumEntries());
    if (series.isEmpty())
      return result;

    auto it = series.beginSortedAccess();
    result.addEntry(it->getDateValue(), it->getHighValue() - it->getLowValue());
    Decimal prevClose = it->getCloseValue();

    for (++it; it != series.endSortedAccess(); ++it)
      {
	result.addEntry(it->getDateValue(), it->getTrueRange(prevClose));
	prevClose = it->getCloseValue();
      }

    return result;
  }

  /**
   * @brief Average true range with Wilder smoothing.
   *
   * Seeded with the simple mean of the first period true ranges, then
   * ATR[i] = (ATR[i-1] * (period - 1) + TR[i]) / period.
   *
   * @throws InsufficientDataException if the series has fewer than period entries.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> AverageTrueRangeSeries (const OHLCTimeSeries<Decimal>& series,
						     uint32_t period)
  {
    if (period == 0)
      throw std::domain_error("AverageTrueRangeSeries: period must be positive");

    detail::requireEntries("AverageTrueRangeSeries", period, series.getNumEntries());

    NumericTimeSeries<Decimal> trueRange(TrueRangeSeries(series));
    std::vector<Decimal> tr(trueRange.getTimeSeriesAsVector());
    NumericTimeSeries<Decimal> result(tr.size() - period + 1);

    Decimal atr(0);
    for (uint32_t i = 0; i < period; ++i)
      atr += tr[i];
    atr = atr / Decimal(period);
    result.addEntry(trueRange.getEntry(period - 1).getDateValue(), atr);

    for (unsigned long i = period; i < tr.size(); ++i)
      {
	atr = (atr * Decimal(period - 1) + tr[i]) / Decimal(period);
	result.addEntry(trueRange.getEntry(i).getDateValue(), atr);
      }

    return result;
  }

  /**
   * @brief Average directional index (Wilder).
   *
   * Directional movement and true range are Wilder-smoothed over period
   * sessions to produce +DI and -DI; DX = 100 * |+DI - -DI| / (+DI + -DI),
   * with DX = 0 when both are zero (a flat series). ADX is the Wilder average
   * of DX seeded with the mean of the first period DX values.
   *
   * @throws InsufficientDataException if the series has fewer than 2 * period entries.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> AdxSeries (const OHLCTimeSeries<Decimal>& series, uint32_t period)
  {
    if (period == 0)
      throw std::domain_error("AdxSeries: period must be positive");

    detail::requireEntries("AdxSeries", 2 * period, series.getNumEntries());

    const unsigned long n = series.getNumEntries();
    const Decimal zero(0);
    const Decimal hundred(100);
    const Decimal p(period);

    std::vector<Decimal> plusDM(n, zero), minusDM(n, zero), tr(n, zero);
    for (unsigned long i = 1; i < n; ++i)
      {
	const OHLCTimeSeriesEntry<Decimal>& cur = series.getEntry(i);
	const OHLCTimeSeriesEntry<Decimal>& prev = series.getEntry(i - 1);

	Decimal upMove = cur.getHighValue() - prev.getHighValue();
	Decimal downMove = prev.getLowValue() - cur.getLowValue();

	plusDM[i] = (upMove > downMove && upMove > zero) ? upMove : zero;
	minusDM[i] = (downMove > upMove && downMove > zero) ? downMove : zero;
	tr[i] = std::max(cur.getHighValue() - cur.getLowValue(),
			 std::max(std::abs(cur.getHighValue() - prev.getCloseValue()),
				  std::abs(cur.getLowValue() - prev.getCloseValue())));
      }

    Decimal smoothedTR(0), smoothedPlus(0), smoothedMinus(0);
    for (unsigned long i = 1; i <= period; ++i)
      {
	smoothedTR += tr[i];
	smoothedPlus += plusDM[i];
	smoothedMinus += minusDM[i];
      }

    auto directionalIndex = [&]() -> Decimal
      {
	if (!(smoothedTR > zero))
	  return zero;

	Decimal plusDI = hundred * smoothedPlus / smoothedTR;
	Decimal minusDI = hundred * smoothedMinus / smoothedTR;
	Decimal diSum = plusDI + minusDI;
	if (!(diSum > zero))
	  return zero;

	return hundred * std::abs(plusDI - minusDI) / diSum;
      };

    std::vector<Decimal> dx;
    dx.reserve(n - period);
    dx.push_back(directionalIndex());

    for (unsigned long i = period + 1; i < n; ++i)
      {
	smoothedTR = smoothedTR - (smoothedTR / p) + tr[i];
	smoothedPlus = smoothedPlus - (smoothedPlus / p) + plusDM[i];
	smoothedMinus = smoothedMinus - (smoothedMinus / p) + minusDM[i];
	dx.push_back(directionalIndex());
      }

    // dx[k] is dated at series index (period + k)
    NumericTimeSeries<Decimal> result(dx.size() - period + 1);

    Decimal adx(0);
    for (uint32_t k = 0; k < period; ++k)
      adx += dx[k];
    adx = adx / p;
    result.addEntry(series.getEntry(2 * period - 1).getDateValue(), adx);

    for (unsigned long k = period; k < dx.size(); ++k)
      {
	adx = (adx * Decimal(period - 1) + dx[k]) / p;
	result.addEntry(series.getEntry(period + k).getDateValue(), adx);
      }

    return result;
  }

  /**
   * @brief Ratio of two series on the dates they share.
   *
   * @throws std::domain_error if a denominator on a shared date is not positive.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> RelativePerformanceSeries (const NumericTimeSeries<Decimal>& numerator,
							const NumericTimeSeries<Decimal>& denominator)
  {
    NumericTimeSeries<Decimal> result(std::min(numerator.getNumEntries(),
					       denominator.getNumEntries()));

    auto it1 = numerator.beginSortedAccess();
    auto it2 = denominator.beginSortedAccess();

    while (it1 != numerator.endSortedAccess() && it2 != denominator.endSortedAccess())
      {
	if (it1->getDateValue() < it2->getDateValue())
	  ++it1;
	else if (it2->getDateValue() < it1->getDateValue())
	  ++it2;
	else
	  {
	    if (!(it2->getValue() > Decimal(0)))
	      throw std::domain_error("RelativePerformanceSeries: non-positive denominator on " +
				      boost::gregorian::to_simple_string(it2->getDateValue()));

	    result.addEntry(it1->getDateValue(), it1->getValue() / it2->getValue());
	    ++it1;
	    ++it2;
	  }
      }

    return result;
  }

  /**
   * @brief Last value of each calendar week (weeks start on Monday), dated on
   * the last session of that week.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> WeeklyLastValueSeries (const NumericTimeSeries<Decimal>& series)
  {
    NumericTimeSeries<Decimal> result;
    if (series.isEmpty())
      return result;

    auto it = series.beginSortedAccess();
    auto lastInWeek = it;
    boost::gregorian::date currentWeek = detail::weekStart(it->getDateValue());

    for (++it; it != series.endSortedAccess(); ++it)
      {
	boost::gregorian::date week = detail::weekStart(it->getDateValue());
	if (week != currentWeek)
	  {
	    result.addEntry(*lastInWeek);
	    currentWeek = week;
	  }
	lastInWeek = it;
      }

    result.addEntry(*lastInWeek);
    return result;
  }

  /**
   * @brief Mansfield relative strength on weekly closes.
   *
   * RP = close / benchmark close on shared sessions, sampled on the last
   * session of each week; MRS = (RP / SMA(RP, lookbackWeeks) - 1) * 100.
   *
   * @throws InsufficientDataException if fewer than lookbackWeeks weekly points overlap.
   */
  template <class Decimal>
  NumericTimeSeries<Decimal> MansfieldRelativeStrengthSeries (const OHLCTimeSeries<Decimal>& series,
							      const OHLCTimeSeries<Decimal>& benchmark,
							      uint32_t lookbackWeeks)
  {
    NumericTimeSeries<Decimal> weeklyRP(WeeklyLastValueSeries(RelativePerformanceSeries(series.CloseTimeSeries(),
											  benchmark.CloseTimeSeries())));
    NumericTimeSeries<Decimal> rpAverage(SmaSeries(weeklyRP, lookbackWeeks));
    NumericTimeSeries<Decimal> result(rpAverage.getNumEntries());

    for (auto it = rpAverage.beginSortedAccess(); it != rpAverage.endSortedAccess(); ++it)
      {
	Decimal rp = weeklyRP.getValue(it->getDateValue());
	result.addEntry(it->getDateValue(), (rp / it->getValue() - Decimal(1)) * Decimal(100));
      }

    return result;
  }

  /**
   * @brief Least-squares slope of values against their index (0, 1, ...).
   *
   * @throws InsufficientDataException for fewer than two values.
   */
  template <class Decimal>
  Decimal LinearRegressionSlope (const std::vector<Decimal>& values)
  {
    detail::requireEntries("LinearRegressionSlope", 2, values.size());

    const double n = static_cast<double>(values.size());
    const double meanX = (n - 1.0) / 2.0;
    const double meanY = static_cast<double>(Mean(values));

    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i)
      {
	double dx = static_cast<double>(i) - meanX;
	sxy += dx * (static_cast<double>(values[i]) - meanY);
	sxx += dx * dx;
      }

    return Decimal(sxy / sxx);
  }

  /**
   * @brief Slope of the last `points` values of a series.
   */
  template <class Decimal>
  Decimal TrailingSlope (const NumericTimeSeries<Decimal>& series, uint32_t points)
  {
    detail::requireEntries("TrailingSlope", points, series.getNumEntries());

    std::vector<Decimal> all(series.getTimeSeriesAsVector());
    std::vector<Decimal> tail(all.end() - points, all.end());
    return LinearRegressionSlope(tail);
  }

} // namespace swing_timeseries

#endif // __SWING_TIMESERIES_INDICATORS_H
