
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

#include "stats/perm.h"
#include "stats/cluster.h"
#include "stats/design.h"
#include "stats/glm.h"
#include "miscmath/crandom.h"
#include "defs/defs.h"
#include "helper/logger.h"

#include <cmath>
#include <algorithm>
#include <set>
#include <string>

extern logger_t logger;

namespace {

// intercept + parametric x; 'effect' added to features [f0,f1] in proportion to x
group_glm_t parametric_model( int n , int nf , int f0 , int f1 , double effect , uint64_t seed )
{
  crandom_t rng( seed );

  covariates_t covs;
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = i - ( n - 1 ) / 2.0;
  covs[ "x" ] = x;

  design_config_t config;
  config.add_regressor( "Intercept" , REG_CONSTANT );
  config.add_regressor( "X" , REG_PARAMETRIC , "x" , std::vector<double>() , "z" );
  std::map<std::string,double> w;
  w[ "X" ] = 1;
  config.add_contrast( "X" , w );

  group_glm_t model( config.design( covs , n ) );

  Eigen::MatrixXd Y( n , nf );
  for (int i=0; i<n; i++)
    for (int f=0; f<nf; f++)
      Y(i,f) = rng.rand_normal() + ( f >= f0 && f <= f1 ? effect * model.design.X(i,1) : 0 );

  model.add_data( "cope1" , Y );
  model.fit();
  return model;
}

}

TEST( ClusterTest , SignedMasses )
{
  Eigen::VectorXd T( 8 );
  T << 0 , 3 , 3.5 , 0 , -4 , -4 , 0 , 1 ;

  adjacency_t adj = grid_adjacency( std::vector<int>( 1 , 8 ) );

  clusters_t cl( T , 2 , adj );

  ASSERT_EQ( cl.size() , 2 );

  // by decreasing |mass|
  EXPECT_DOUBLE_EQ( cl.clusters[0].mass , -8 );
  EXPECT_EQ( cl.clusters[0].seed , 4 );
  EXPECT_DOUBLE_EQ( cl.clusters[1].mass , 6.5 );
  EXPECT_EQ( cl.clusters[1].seed , 2 );
  EXPECT_EQ( cl.clusters[1].members.size() , 2u );
  EXPECT_DOUBLE_EQ( cl.max_mass , 8 );

  EXPECT_EQ( cl.label[0] , -1 );
  EXPECT_EQ( cl.label[1] , 1 );
  EXPECT_EQ( cl.label[5] , 0 );
  EXPECT_EQ( cl.label[7] , -1 );
}

TEST( ClusterTest , OppositeSignsDoNotMerge )
{
  Eigen::VectorXd T( 2 );
  T << 3 , -3 ;
  clusters_t cl( T , 2 , grid_adjacency( std::vector<int>( 1 , 2 ) ) );
  EXPECT_EQ( cl.size() , 2 );
  EXPECT_DOUBLE_EQ( cl.max_mass , 3 );
}

TEST( ClusterTest , GridAndChannelAdjacency )
{
  std::vector<int> shape;
  shape.push_back( 2 );
  shape.push_back( 3 );

  adjacency_t grid = grid_adjacency( shape );
  EXPECT_EQ( grid[0] , std::set<int>( { 1 , 3 } ) );
  EXPECT_EQ( grid[4] , std::set<int>( { 1 , 3 , 5 } ) );

  // along axis 1, channel 0 touches channel 2 only
  adjacency_t chans;
  chans[0].insert( 2 );
  chans[2].insert( 0 );

  adjacency_t adj = grid_adjacency( shape , 1 , &chans );
  EXPECT_EQ( adj[0] , std::set<int>( { 2 , 3 } ) );
  EXPECT_EQ( adj[1] , std::set<int>( { 4 } ) );
  EXPECT_EQ( adj[5] , std::set<int>( { 2 , 3 } ) );

  EXPECT_THROW( grid_adjacency( shape , 2 , &chans ) , ephys_error );
}

TEST( PermTest , SinglePermutationIsObserved )
{
  group_glm_t model = parametric_model( 12 , 5 , 1 , 2 , 1.0 , 7 );

  perm_opts_t opts;
  opts.nperms = 1;

  perm_t perm( model , 0 , 0 , opts );
  const null_dist_t & nd = perm.run();

  ASSERT_EQ( nd.nulls.size() , 1u );
  EXPECT_EQ( nd.nfailed , 0 );
  EXPECT_DOUBLE_EQ( nd.get_threshold( 100 ) , nd.nulls[0] );

  // max |t| over features
  double mx = 0;
  for (int f=0; f<5; f++)
    mx = std::max( mx , fabs( model.fits[0].tstats(0,f) ) );
  EXPECT_NEAR( nd.nulls[0] , mx , 1e-10 );

  std::pair<double,double> thr = nd.get_thresholds( 100 );
  EXPECT_DOUBLE_EQ( thr.first , -thr.second );
}

TEST( PermTest , CopeMetric )
{
  group_glm_t model = parametric_model( 12 , 5 , 1 , 2 , 1.0 , 7 );

  perm_opts_t opts;
  opts.nperms = 1;
  opts.metric = PERM_COPES;

  null_dist_t nd = run_permutations( model , 0 , 0 , opts );

  double mx = 0;
  for (int f=0; f<5; f++)
    mx = std::max( mx , fabs( model.fits[0].copes(0,f) ) );
  EXPECT_NEAR( nd.nulls[0] , mx , 1e-10 );
}

TEST( PermTest , StateMachine )
{
  group_glm_t model = parametric_model( 12 , 5 , 1 , 2 , 1.0 , 7 );

  perm_opts_t opts;
  opts.nperms = 10;

  perm_t perm( model , 0 , 0 , opts );
  EXPECT_EQ( perm.state() , PERM_CONFIGURED );
  EXPECT_THROW( perm.get_threshold( 95 ) , ephys_error );

  perm.run();
  EXPECT_EQ( perm.state() , PERM_COMPLETE );
  EXPECT_EQ( perm.null_dist().nulls.size() , 10u );
  EXPECT_THROW( perm.run() , ephys_error );
}

TEST( PermTest , RejectsBadArguments )
{
  group_glm_t model = parametric_model( 12 , 5 , 1 , 2 , 1.0 , 7 );

  perm_opts_t opts;
  EXPECT_THROW( perm_t( model , 1 , 0 , opts ) , ephys_error );
  EXPECT_THROW( perm_t( model , 0 , 1 , opts ) , ephys_error );

  opts.nperms = 0;
  EXPECT_THROW( perm_t( model , 0 , 0 , opts ) , ephys_error );
}

TEST( PermTest , SameNullsForAnyNumberOfWorkers )
{
  group_glm_t model = parametric_model( 16 , 6 , 2 , 3 , 0.5 , 11 );

  perm_opts_t opts;
  opts.nperms = 50;
  opts.seed = 99;

  opts.nworkers = 1;
  null_dist_t one = run_permutations( model , 0 , 0 , opts );

  opts.nworkers = 4;
  null_dist_t four = run_permutations( model , 0 , 0 , opts );

  ASSERT_EQ( one.nulls.size() , 50u );
  EXPECT_EQ( one.nulls , four.nulls );

  // a different seed gives a different null
  opts.seed = 100;
  null_dist_t other = run_permutations( model , 0 , 0 , opts );
  EXPECT_EQ( other.nulls[0] , one.nulls[0] );
  EXPECT_NE( other.nulls , one.nulls );
}

TEST( PermTest , RankDeficientDrawsAreCounted )
{
  // permuting A can reproduce B (or 5 - B), making the design singular
  covariates_t covs;
  const double a[] = { 1 , 2 , 3 , 4 };
  const double b[] = { 1 , 2 , 4 , 3 };
  covs[ "a" ] = std::vector<double>( a , a + 4 );
  covs[ "b" ] = std::vector<double>( b , b + 4 );

  design_config_t config;
  config.add_regressor( "Intercept" , REG_CONSTANT );
  config.add_regressor( "A" , REG_PARAMETRIC , "a" );
  config.add_regressor( "B" , REG_PARAMETRIC , "b" );
  std::map<std::string,double> w;
  w[ "A" ] = 1;
  config.add_contrast( "A" , w );

  group_glm_t model( config.design( covs , 4 ) );
  Eigen::MatrixXd Y( 4 , 3 );
  Y << 0.5 , 1.0 , -0.2 ,
       1.5 , 0.1 ,  0.3 ,
       2.0 , 0.7 ,  0.9 ,
       3.5 , 0.2 , -0.4 ;
  model.add_data( "cope1" , Y );
  model.fit();

  perm_opts_t opts;
  opts.nperms = 200;
  opts.seed = 3;

  perm_t perm( model , 0 , 0 , opts );
  EXPECT_EQ( perm.scheme() , PERM_ROW_SHUFFLE );

  // capture the log to check each skipped draw is reported
  globals::cache_log = true;
  logger.flush_cache();

  const null_dist_t & nd = perm.run();

  const std::string log = logger.print_buffer();
  globals::cache_log = false;

  EXPECT_GT( nd.nfailed , 0 );
  EXPECT_EQ( (int)nd.nulls.size() + nd.nfailed , 200 );

  int nwarn = 0;
  std::size_t pos = 0;
  while ( ( pos = log.find( " ** warning: permutation " , pos ) ) != std::string::npos ) { ++nwarn; ++pos; }
  EXPECT_EQ( nwarn , nd.nfailed );
  EXPECT_NE( log.find( "skipped: rank deficient design" ) , std::string::npos );
}

TEST( PermTest , SignFlipForMeanEffects )
{
  covariates_t covs;
  design_config_t config;
  config.add_regressor( "Mean" , REG_CONSTANT );
  config.add_simple_contrasts();

  group_glm_t model( config.design( covs , 10 ) );
  Eigen::MatrixXd Y( 10 , 2 );
  for (int i=0; i<10; i++)
    {
      Y(i,0) = 1 + 0.1 * i;
      Y(i,1) = ( i % 2 ? 1 : -1 ) * 0.1 * i;
    }
  model.add_data( "cope1" , Y );
  model.fit();

  perm_opts_t opts;
  opts.nperms = 100;

  perm_t perm( model , 0 , 0 , opts );
  EXPECT_EQ( perm.scheme() , PERM_SIGN_FLIP );

  perm.run();

  // the consistent positive mean is significant, the alternating one is not
  std::vector<bool> sig = perm.get_sig_mask( 95 );
  EXPECT_TRUE( sig[0] );
  EXPECT_FALSE( sig[1] );
}

TEST( PermTest , ClusterInference )
{
  group_glm_t model = parametric_model( 20 , 10 , 3 , 5 , 2.0 , 5 );

  perm_opts_t opts;
  opts.nperms = 200;
  opts.method = PERM_CLUSTER;
  opts.cluster_threshold = 3;
  opts.nworkers = 2;

  perm_t perm( model , 0 , 0 , opts );
  perm.run();

  std::vector<cluster_t> sig = perm.get_sig_clusters( 95 );

  ASSERT_GE( sig.size() , 1u );
  EXPECT_TRUE( sig[0].members.count( 3 ) );
  EXPECT_TRUE( sig[0].members.count( 4 ) );
  EXPECT_TRUE( sig[0].members.count( 5 ) );
  EXPECT_GT( sig[0].mass , 0 );
  EXPECT_LT( sig[0].p , 0.05 );
  EXPECT_GE( sig[0].p , 1 / 200.0 );

  std::vector<bool> mask = perm.get_sig_mask( 95 );
  EXPECT_TRUE( mask[4] );
}

TEST( PermTest , MaxStatMaskFlagsEffect )
{
  group_glm_t model = parametric_model( 20 , 10 , 3 , 5 , 2.0 , 5 );

  perm_opts_t opts;
  opts.nperms = 200;

  perm_t perm( model , 0 , 0 , opts );
  perm.run();

  std::vector<bool> mask = perm.get_sig_mask( 95 );
  ASSERT_EQ( mask.size() , 10u );
  EXPECT_TRUE( mask[3] );
  EXPECT_TRUE( mask[4] );
  EXPECT_TRUE( mask[5] );

  EXPECT_THROW( perm.get_sig_clusters( 95 ) , ephys_error );
}
