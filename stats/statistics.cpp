
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

#include "stats/statistics.h"

#include <boost/math/distributions/students_t.hpp>

#include <cmath>
#include <limits>

double Statistics::qt( double p , double df )
{
  if ( ! ( df > 0 ) || ! ( p > 0 && p < 1 ) )
    return std::numeric_limits<double>::quiet_NaN();
  boost::math::students_t dist( df );
  return boost::math::quantile( dist , p );
}

double Statistics::t_prob( double T , double df )
{
  if ( std::isnan( T ) || ! ( df > 0 ) )
    return std::numeric_limits<double>::quiet_NaN();
  boost::math::students_t dist( df );
  return 2 * boost::math::cdf( boost::math::complement( dist , fabs( T ) ) );
}
