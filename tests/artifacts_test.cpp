
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

#include <gtest/gtest.h>

#include "artifacts/artifacts.h"
#include "stats/ndarray.h"
#include "defs/defs.h"

#include <cmath>

namespace {

const double PI = 3.14159265358979323846;

// period-25 sine whose amplitude grows slowly per segment; segment 'spike' x100
double sample( int t , int seglen , int spike )
{
  const int s = t / seglen;
  double x = ( 1 + 0.05 * s ) * sin( 2 * PI * t / 25.0 );
  if ( s == spike ) x *= 100;
  return x;
}

ndarray_t series( int n , int seglen , int spike )
{
  std::vector<int> shape( 1 , n );
  ndarray_t X( shape );
  for (int t=0; t<n; t++) X.data[t] = sample( t , seglen , spike );
  return X;
}

// channels x time; only the first 'nspiked' channels carry the spike
ndarray_t channels( int nch , int n , int seglen , int spike , int nspiked )
{
  std::vector<int> shape;
  shape.push_back( nch );
  shape.push_back( n );
  ndarray_t X( shape );
  for (int c=0; c<nch; c++)
    for (int t=0; t<n; t++)
      X.data[ c * n + t ] = sample( t , seglen , c < nspiked ? spike : -1 ) * ( 1 + 0.1 * c );
  return X;
}

}

TEST( NdarrayTest , ResolvesNegativeAxes )
{
  std::vector<int> shape;
  shape.push_back( 3 );
  shape.push_back( 4 );
  ndarray_t X( shape );
  EXPECT_EQ( X.resolve_axis( -1 , "axis" ) , 1 );
  EXPECT_EQ( X.resolve_axis( 0 , "axis" ) , 0 );
  EXPECT_THROW( X.resolve_axis( 2 , "axis" ) , ephys_error );
  EXPECT_THROW( X.resolve_axis( -3 , "axis" ) , ephys_error );
}

TEST( ArtefactTest , SegmentSpikeFlagsOneSegment )
{
  const int n = 1000;
  const int lens[] = { 50 , 100 , 125 , 200 };

  for (int k=0; k<4; k++)
    {
      const int L = lens[k];

      artefact_opts_t opts;
      opts.mode = SCAN_SEGMENTS;
      opts.axis = 0;
      opts.segment_len = L;

      artefact_scan_t res = detect_artefacts( series( n , L , 3 ) , opts );

      ASSERT_EQ( res.bad.size() , (size_t)n ) << "L=" << L;
      EXPECT_EQ( res.nsegments , n / L );
      EXPECT_EQ( res.n_bad() , L ) << "L=" << L;
      for (int t=0; t<n; t++)
	EXPECT_EQ( res.bad[t] , t >= 3 * L && t < 4 * L ) << "L=" << L << " t=" << t;
    }
}

TEST( ArtefactTest , ShortFinalSegment )
{
  // 1000 samples in segments of 300: the last holds 100 samples
  artefact_opts_t opts;
  opts.mode = SCAN_SEGMENTS;
  opts.axis = 0;
  opts.segment_len = 300;

  artefact_scan_t res = detect_artefacts( series( 1000 , 300 , -1 ) , opts );

  EXPECT_EQ( res.nsegments , 4 );
  EXPECT_EQ( res.metric.size() , 4u );
  EXPECT_EQ( res.bad.size() , 1000u );
}

TEST( ArtefactTest , DimensionModeFlagsNoisyChannel )
{
  std::vector<int> shape;
  shape.push_back( 6 );
  shape.push_back( 100 );
  ndarray_t X( shape );
  const double amp[] = { 1 , 1.02 , 1.04 , 1.06 , 1.08 , 10 };
  for (int c=0; c<6; c++)
    for (int t=0; t<100; t++)
      X.data[ c * 100 + t ] = amp[c] * sin( 2 * PI * t / 25.0 );

  artefact_opts_t opts;
  opts.axis = 0;

  artefact_scan_t res = detect_artefacts( X , opts );

  ASSERT_EQ( res.bad.size() , 6u );
  EXPECT_EQ( res.n_bad() , 1 );
  EXPECT_TRUE( res.bad[5] );
  EXPECT_EQ( res.metric.size() , 6u );
}

TEST( ArtefactTest , ReturnModes )
{
  artefact_opts_t opts;
  opts.mode = SCAN_SEGMENTS;
  opts.axis = 0;
  opts.segment_len = 100;

  opts.ret = RET_GOOD_INDS;
  artefact_scan_t good = detect_artefacts( series( 1000 , 100 , 3 ) , opts );
  EXPECT_FALSE( good.mask[ 350 ] );
  EXPECT_TRUE( good.mask[ 50 ] );

  opts.ret = RET_ZERO_BADS;
  artefact_scan_t zeroed = detect_artefacts( series( 1000 , 100 , 3 ) , opts );
  EXPECT_EQ( zeroed.data.data[ 351 ] , 0 );
  EXPECT_NE( zeroed.data.data[ 51 ] , 0 );

  opts.ret = RET_NAN_BADS;
  artefact_scan_t nans = detect_artefacts( series( 1000 , 100 , 3 ) , opts );
  EXPECT_TRUE( std::isnan( nans.data.data[ 351 ] ) );
  EXPECT_FALSE( std::isnan( nans.data.data[ 51 ] ) );
}

TEST( ArtefactTest , ChannelWiseAny )
{
  artefact_opts_t opts;
  opts.mode = SCAN_SEGMENTS;
  opts.axis = 1;
  opts.segment_len = 100;
  opts.channel_wise = true;
  opts.channel_axis = 0;
  opts.channel_any = true;

  artefact_scan_t res = detect_artefacts( channels( 4 , 1000 , 100 , 3 , 1 ) , opts );

  EXPECT_EQ( res.n_bad() , 100 );
  EXPECT_TRUE( res.bad[ 300 ] );
  EXPECT_TRUE( res.bad[ 399 ] );
  EXPECT_FALSE( res.bad[ 400 ] );
}

TEST( ArtefactTest , ChannelWiseThresholdBoundary )
{
  artefact_opts_t opts;
  opts.mode = SCAN_SEGMENTS;
  opts.axis = 1;
  opts.segment_len = 100;
  opts.channel_wise = true;
  opts.channel_axis = 0;

  // 2 of 4 channels flag segment 3
  ndarray_t X = channels( 4 , 1000 , 100 , 3 , 2 );

  // 2 >= 0.5 * 4
  opts.channel_threshold = 0.5;
  EXPECT_EQ( detect_artefacts( X , opts ).n_bad() , 100 );

  // 2 < 0.75 * 4
  opts.channel_threshold = 0.75;
  EXPECT_EQ( detect_artefacts( X , opts ).n_bad() , 0 );
}

TEST( ArtefactTest , ChannelWiseValidation )
{
  artefact_opts_t opts;
  opts.mode = SCAN_SEGMENTS;
  opts.axis = 1;
  opts.segment_len = 100;
  opts.channel_wise = true;

  ndarray_t X = channels( 4 , 1000 , 100 , 3 , 2 );

  opts.channel_axis = 1;
  EXPECT_THROW( detect_artefacts( X , opts ) , ephys_error );

  opts.channel_axis = 0;
  opts.channel_threshold = 0;
  EXPECT_THROW( detect_artefacts( X , opts ) , ephys_error );

  opts.channel_threshold = 1.5;
  EXPECT_THROW( detect_artefacts( X , opts ) , ephys_error );

  // 4 x 0.2 is less than one channel
  opts.channel_threshold = 0.2;
  EXPECT_THROW( detect_artefacts( X , opts ) , ephys_error );
}

TEST( ArtefactTest , NanSegmentMetricIsZeroFilled )
{
  // a fully missing segment gives a NaN metric, which must not derail the test
  ndarray_t X = series( 1000 , 100 , 3 );
  for (int t=600; t<700; t++) X.data[t] = std::nan( "" );

  artefact_opts_t opts;
  opts.mode = SCAN_SEGMENTS;
  opts.axis = 0;
  opts.segment_len = 100;

  artefact_scan_t res = detect_artefacts( X , opts );

  ASSERT_EQ( res.metric.size() , 10u );
  EXPECT_EQ( res.metric[6] , 0 );
  EXPECT_TRUE( res.bad[ 350 ] );
}
