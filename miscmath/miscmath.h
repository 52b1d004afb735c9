
//    --------------------------------------------------------------------
//
//    This file is part of ephys.
//
//    ephys is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    ephys is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with ephys. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __EPHYS_MISCMATH_H__
#define __EPHYS_MISCMATH_H__

#include <vector>
#include <cmath>

#include "defs/defs.h"

namespace MiscMath
{

  // mean/variance: population (ddof=0) unless noted

  double mean( const std::vector<double> & x );

  double variance( const std::vector<double> & x );
  double variance( const std::vector<double> & x , double m );

  // with n-1 denominator
  double sample_variance( const std::vector<double> & x );

  double sdev( const std::vector<double> & x );
  double sdev( const std::vector<double> & x , double m );

  // excess (Fisher) kurtosis, biased
  double kurtosis0( const std::vector<double> & x );
  double kurtosis( const std::vector<double> & x );
  double kurtosis( const std::vector<double> & x , double m );

  // std / var / kurtosis
  double metric( const std::vector<double> & x , metric_t m );

  // ignoring NaN
  double nanmean( const std::vector<double> & x );
  double nansdev( const std::vector<double> & x );

  // p in [0,100], linear interpolation between order statistics
  double percentile( const std::vector<double> & x , double p );

  double max( const std::vector<double> & x );

  // x[i+1] - x[i]
  std::vector<double> diff( const std::vector<double> & x );

}

#endif
