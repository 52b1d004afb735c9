
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

#include "stats/gesd.h"
#include "stats/statistics.h"
#include "miscmath/crandom.h"
#include "defs/defs.h"

#include <cmath>
#include <limits>

namespace {

std::vector<double> sine( int n )
{
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = sin( (double)i );
  return x;
}

}

TEST( StatisticsTest , StudentTQuantile )
{
  EXPECT_NEAR( Statistics::qt( 0.975 , 10 ) , 2.228139 , 1e-5 );
  EXPECT_NEAR( Statistics::qt( 0.5 , 3 ) , 0 , 1e-12 );
  EXPECT_TRUE( std::isnan( Statistics::qt( 0.975 , 0 ) ) );
  EXPECT_TRUE( std::isnan( Statistics::qt( 1.0 , 5 ) ) );
}

TEST( GesdTest , FlagsLargeSpikeTwoSided )
{
  std::vector<double> x = sine( 20 );
  x[7] = 10;

  gesd_result_t res = gesd( x , 0.05 );

  ASSERT_EQ( res.n_outliers() , 1 );
  EXPECT_TRUE( res.mask[7] );
  ASSERT_EQ( res.removed.size() , 1u );
  EXPECT_EQ( res.removed[0] , 7 );
  EXPECT_EQ( res.cleaned.size() , 19u );

  // ceil( 20 * 0.1 ) rounds
  ASSERT_EQ( res.R.size() , 2u );
  EXPECT_NEAR( res.R[0] , 4.16681 , 1e-4 );
  EXPECT_NEAR( res.lambda[0] , 2.70825 , 1e-4 );
}

TEST( GesdTest , FlagsLargeSpikeUpperSide )
{
  std::vector<double> x = sine( 20 );
  x[7] = 10;

  gesd_result_t res = gesd( x , 0.05 , 0.1 , 1 );

  ASSERT_EQ( res.n_outliers() , 1 );
  EXPECT_TRUE( res.mask[7] );

  // alpha is not halved for a one-sided test
  EXPECT_NEAR( res.lambda[0] , 2.55658 , 1e-4 );
}

TEST( GesdTest , LowerSideIgnoresHighSpike )
{
  std::vector<double> x = sine( 20 );
  x[7] = 10;

  gesd_result_t res = gesd( x , 0.05 , 0.1 , -1 );

  EXPECT_EQ( res.n_outliers() , 0 );
  EXPECT_EQ( res.cleaned.size() , 20u );
}

TEST( GesdTest , LargestRoundRuleUnmasksGroup )
{
  // three equal outliers: only the third round exceeds its critical value
  std::vector<double> x = sine( 20 );
  x[3] = x[8] = x[13] = 4;

  gesd_result_t res = gesd( x , 0.05 , 0.2 , 0 );

  ASSERT_EQ( res.R.size() , 4u );
  EXPECT_LT( res.R[0] , res.lambda[0] );
  EXPECT_LT( res.R[1] , res.lambda[1] );
  EXPECT_GT( res.R[2] , res.lambda[2] );

  ASSERT_EQ( res.removed.size() , 3u );

  // ties go to the first index
  EXPECT_EQ( res.removed[0] , 3 );
  EXPECT_EQ( res.removed[1] , 8 );
  EXPECT_EQ( res.removed[2] , 13 );
}

TEST( GesdTest , MissingValuesAreSkippedAndIndexedBack )
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  std::vector<double> x = sine( 20 );
  x[7] = 10;
  x.insert( x.begin() + 2 , nan );

  gesd_result_t res = gesd( x , 0.05 );

  ASSERT_EQ( res.mask.size() , 21u );
  ASSERT_EQ( res.n_outliers() , 1 );

  // the spike moved up by one position
  EXPECT_TRUE( res.mask[8] );
  EXPECT_FALSE( res.mask[2] );
  EXPECT_EQ( res.removed[0] , 8 );

  // the missing value stays in the cleaned output
  ASSERT_EQ( res.cleaned.size() , 20u );
  EXPECT_TRUE( std::isnan( res.cleaned[2] ) );
}

TEST( GesdTest , MissingValuesCountTowardsRounds )
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  std::vector<double> x;
  for (int i=0; i<8; i++) x.push_back( 0.1 * sin( (double)i ) );
  x.push_back( 50 );
  x.push_back( 51 );
  for (int i=0; i<8; i++) x.push_back( nan );

  gesd_result_t res = gesd( x , 0.05 , 0.1 , 0 );

  // ceil( 18 * 0.1 ) rounds over the 10 finite values
  ASSERT_EQ( res.R.size() , 2u );

  // the pair masks itself in the first round
  EXPECT_LT( res.R[0] , res.lambda[0] );
  EXPECT_GT( res.R[1] , res.lambda[1] );

  ASSERT_EQ( res.n_outliers() , 2 );
  EXPECT_TRUE( res.mask[8] );
  EXPECT_TRUE( res.mask[9] );
  ASSERT_EQ( res.removed.size() , 2u );
  EXPECT_EQ( res.removed[0] , 9 );
  EXPECT_EQ( res.removed[1] , 8 );

  EXPECT_EQ( res.cleaned.size() , 16u );
}

TEST( GesdTest , ConstantInputHasNoOutliers )
{
  std::vector<double> x( 30 , 1.5 );
  gesd_result_t res = gesd( x , 0.05 );
  EXPECT_EQ( res.n_outliers() , 0 );
}

TEST( GesdTest , RejectsBadArguments )
{
  std::vector<double> x = sine( 20 );
  EXPECT_THROW( gesd( x , 0.0 ) , ephys_error );
  EXPECT_THROW( gesd( x , 1.5 ) , ephys_error );
  EXPECT_THROW( gesd( x , 0.05 , 1.5 ) , ephys_error );
  EXPECT_THROW( gesd( x , 0.05 , 0.1 , 2 ) , ephys_error );
}

TEST( GesdTest , NominalFalsePositiveRate )
{
  crandom_t rng( 1234 );

  const int nrep = 1000;
  int any = 0;

  for (int r=0; r<nrep; r++)
    {
      std::vector<double> x( 50 );
      for (int i=0; i<50; i++) x[i] = rng.rand_normal();
      if ( gesd( x , 0.05 ).n_outliers() > 0 ) ++any;
    }

  const double rate = any / (double)nrep;
  EXPECT_GT( rate , 0.02 );
  EXPECT_LT( rate , 0.09 );
}
