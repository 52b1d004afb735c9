
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

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <algorithm>
#include <limits>

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return std::numeric_limits<double>::quiet_NaN();
  double s = 0;
  for (int i=0; i<n; i++) s += x[i];
  return s / (double)n;
}

double MiscMath::variance( const std::vector<double> & x )
{
  return variance( x , mean( x ) );
}

double MiscMath::variance( const std::vector<double> & x , double m )
{
  const int n = x.size();
  if ( n == 0 ) return std::numeric_limits<double>::quiet_NaN();
  double ss = 0;
  for (int i=0; i<n; i++) ss += ( x[i] - m ) * ( x[i] - m );
  return ss / (double)n;
}

double MiscMath::sample_variance( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n < 2 ) return std::numeric_limits<double>::quiet_NaN();
  return variance( x ) * n / (double)( n - 1 );
}

double MiscMath::sdev( const std::vector<double> & x )
{
  return sqrt( variance( x ) );
}

double MiscMath::sdev( const std::vector<double> & x , double m )
{
  return sqrt( variance( x , m ) );
}

double MiscMath::kurtosis( const std::vector<double> & x )
{
  return kurtosis( x , MiscMath::mean( x ) );
}

double MiscMath::kurtosis( const std::vector<double> & x , double m )
{
  std::vector<double> d = x;
  for (int i=0; i<d.size(); i++) d[i] -= m;
  return kurtosis0( d );
}

double MiscMath::kurtosis0( const std::vector<double> & x )
{
  // assumes mean = 0
  const int n = x.size();

  double numer = 0 , denom = 0;
  for (int i=0; i<n; i++)
    {
      const double x2 = x[i] * x[i];
      numer += x2 * x2;
      denom += x2;
    }
  numer /= (double)n;
  denom /= (double)n;
  denom *= denom;
  // constant input gives 0/0, i.e. NaN
  return numer / denom - 3.0;
}

double MiscMath::metric( const std::vector<double> & x , metric_t m )
{
  if ( m == METRIC_STD ) return sdev( x );
  if ( m == METRIC_VAR ) return variance( x );
  return kurtosis( x );
}

double MiscMath::nanmean( const std::vector<double> & x )
{
  double s = 0;
  int n = 0;
  for (int i=0; i<x.size(); i++)
    if ( ! std::isnan( x[i] ) ) { s += x[i]; ++n; }
  return n ? s / (double)n : std::numeric_limits<double>::quiet_NaN();
}

double MiscMath::nansdev( const std::vector<double> & x )
{
  const double m = nanmean( x );
  double ss = 0;
  int n = 0;
  for (int i=0; i<x.size(); i++)
    if ( ! std::isnan( x[i] ) ) { ss += ( x[i] - m ) * ( x[i] - m ); ++n; }
  return n ? sqrt( ss / (double)n ) : std::numeric_limits<double>::quiet_NaN();
}

double MiscMath::percentile( const std::vector<double> & x , double p )
{
  const int n = x.size();
  if ( n == 0 ) Helper::halt( "cannot take a percentile of an empty set" );
  if ( p < 0 || p > 100 ) Helper::halt( "percentile must be between 0 and 100: " + Helper::dbl2str( p ) );

  std::vector<double> s = x;
  std::sort( s.begin() , s.end() );

  // rank on 0..n-1 scale
  const double r = ( p / 100.0 ) * ( n - 1 );
  const int lwr = (int)floor( r );
  const int upr = lwr + 1 < n ? lwr + 1 : lwr;
  const double f = r - lwr;
  return s[lwr] + f * ( s[upr] - s[lwr] );
}

double MiscMath::max( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return std::numeric_limits<double>::quiet_NaN();
  return *std::max_element( x.begin() , x.end() );
}

std::vector<double> MiscMath::diff( const std::vector<double> & x )
{
  std::vector<double> d;
  if ( x.size() < 2 ) return d;
  d.resize( x.size() - 1 );
  for (int i=1; i<x.size(); i++) d[i-1] = x[i] - x[i-1];
  return d;
}
