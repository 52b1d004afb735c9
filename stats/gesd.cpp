
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

#include "stats/gesd.h"
#include "stats/statistics.h"

#include "helper/helper.h"

#include <cmath>
#include <limits>

int gesd_result_t::n_outliers() const
{
  int n = 0;
  for (int i=0; i<mask.size(); i++)
    if ( mask[i] ) ++n;
  return n;
}


gesd_result_t gesd( const std::vector<double> & x , double alpha , double p_out , int side )
{
  gesd_opts_t opts;
  opts.alpha = alpha;
  opts.p_out = p_out;
  opts.side = side;
  return gesd( x , opts );
}


gesd_result_t gesd( const std::vector<double> & x , const gesd_opts_t & opts )
{

  if ( ! ( opts.alpha > 0 && opts.alpha < 1 ) )
    Helper::halt( "gesd: alpha must be between 0 and 1, not " + Helper::dbl2str( opts.alpha ) );

  if ( ! ( opts.p_out >= 0 && opts.p_out <= 1 ) )
    Helper::halt( "gesd: p_out must be between 0 and 1, not " + Helper::dbl2str( opts.p_out ) );

  if ( opts.side < -1 || opts.side > 1 )
    Helper::halt( "gesd: outlier side must be -1, 0 or 1, not " + Helper::int2str( opts.side ) );

  const double alpha = opts.side == 0 ? opts.alpha / 2.0 : opts.alpha ;

  gesd_result_t res;
  res.mask.resize( x.size() , false );

  //
  // test only finite values: fin[j] is the input index of the j-th tested value
  //

  std::vector<int> fin;
  for (int i=0; i<x.size(); i++)
    if ( std::isfinite( x[i] ) ) fin.push_back( i );

  const int n = fin.size();

  // number of rounds set by the full input length, missing values included
  int n_out = (int)ceil( x.size() * opts.p_out );
  if ( n_out > n ) n_out = n;

  std::vector<double> temp( n );
  for (int j=0; j<n; j++) temp[j] = x[ fin[j] ];

  std::vector<bool> alive( n , true );

  res.R.resize( n_out );
  res.lambda.resize( n_out );
  std::vector<int> rm_idx( n_out );

  for (int j=0; j<n_out; j++)
    {

      const int i = j + 1;

      // moments of the values still in play
      double m = 0;
      int cnt = 0;
      for (int k=0; k<n; k++)
	if ( alive[k] ) { m += temp[k]; ++cnt; }
      m /= (double)cnt;

      double ss = 0;
      for (int k=0; k<n; k++)
	if ( alive[k] ) ss += ( temp[k] - m ) * ( temp[k] - m );
      const double sd = sqrt( ss / (double)cnt );

      // most extreme remaining value (first one, if tied)
      int ext = -1;
      double dev = 0;
      for (int k=0; k<n; k++)
	{
	  if ( ! alive[k] ) continue;
	  double d = 0;
	  if ( opts.side == -1 ) d = m - temp[k];
	  else if ( opts.side == 1 ) d = temp[k] - m;
	  else d = fabs( temp[k] - m );
	  if ( ext == -1 || d > dev )
	    {
	      ext = k;
	      dev = d;
	    }
	}

      rm_idx[j] = ext;
      alive[ ext ] = false;

      // zero spread gives NaN (0/0), never exceeding the critical value
      res.R[j] = dev / sd;

      // critical value; NaN once n-i-1 degrees of freedom run out
      const double p = 1.0 - alpha / (double)( n - i + 1 );
      const double t = Statistics::qt( p , n - i - 1 );
      res.lambda[j] = ( ( n - i ) * t ) / sqrt( ( n - i - 1 + t * t ) * ( n - i + 1 ) );

    }

  //
  // Rosner: outliers are everything removed up to the last round with R > lambda
  //

  int last = -1;
  for (int j=0; j<n_out; j++)
    if ( res.R[j] > res.lambda[j] ) last = j;

  for (int j=0; j<=last; j++)
    {
      res.mask[ fin[ rm_idx[j] ] ] = true;
      res.removed.push_back( fin[ rm_idx[j] ] );
    }

  for (int i=0; i<x.size(); i++)
    if ( ! res.mask[i] ) res.cleaned.push_back( x[i] );

  return res;
}
