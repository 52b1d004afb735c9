
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

#include "stats/perm.h"

#include "miscmath/crandom.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <thread>
#include <exception>
#include <algorithm>
#include <cmath>

extern logger_t logger;


void perm_opts_t::set( const param_t & param )
{
  nperms = param.get_int( "nreps" , nperms );
  if ( param.has( "method" ) ) method = globals::perm_method( param.value( "method" ) );
  if ( param.has( "scheme" ) ) scheme = globals::perm_scheme( param.value( "scheme" ) );
  if ( param.has( "metric" ) )
    {
      const std::string m = param.value( "metric" );
      if ( Helper::iequals( m , "tstats" ) ) metric = PERM_TSTATS;
      else if ( Helper::iequals( m , "copes" ) ) metric = PERM_COPES;
      else Helper::halt( "metric must be tstats or copes, not " + m );
    }
  cluster_threshold = param.get_dbl( "th-cluster" , cluster_threshold );
  nworkers = param.get_int( "nthreads" , nworkers );
  if ( param.has( "seed" ) ) seed = (uint64_t)param.requires_int( "seed" );
  verbose = param.yesno( "verbose" , verbose , true );
}


//
// null_dist_t
//

double null_dist_t::get_threshold( double pct ) const
{
  if ( nulls.size() == 0 ) Helper::halt( "empty null distribution" );
  return MiscMath::percentile( nulls , pct );
}

std::pair<double,double> null_dist_t::get_thresholds( double pct ) const
{
  const double t = get_threshold( pct );
  return std::make_pair( -t , t );
}


//
// perm_t
//

perm_t::perm_t( const group_glm_t & model , int gcon , int flcon , const perm_opts_t & opts )
  : model( model ) , gcon( gcon ) , flcon( flcon ) , opts( opts ) , _state( PERM_CONFIGURED )
{

  const design_t & design = model.design;

  if ( model.data.size() == 0 ) Helper::halt( "no group data for permutations" );

  if ( gcon < 0 || gcon >= design.ncons() )
    Helper::halt( "group contrast " + Helper::int2str( gcon ) + " out of range" );

  if ( flcon < 0 || flcon >= model.data.size() )
    Helper::halt( "first-level contrast " + Helper::int2str( flcon ) + " out of range" );

  if ( opts.nperms < 1 ) Helper::halt( "nreps must be at least 1" );

  if ( opts.nworkers < 1 ) Helper::halt( "nthreads must be at least 1" );

  if ( opts.method == PERM_CLUSTER && ! ( opts.cluster_threshold > 0 ) )
    Helper::halt( "th-cluster must be positive" );

  active = design.active( gcon );

  if ( active.size() == 0 )
    Helper::halt( "contrast " + design.contrast_names[ gcon ] + " has no non-zero weights" );

  //
  // resolve the scheme: sign-flip for a mean effect over non-parametric regressors
  //

  _scheme = opts.scheme;

  if ( _scheme == PERM_AUTO )
    {
      bool mean_effect = true;
      double wsum = 0;
      for (int j=0; j<active.size(); j++)
	{
	  if ( design.regressor_types[ active[j] ] == REG_PARAMETRIC ) mean_effect = false;
	  wsum += design.C( gcon , active[j] );
	}
      if ( wsum == 0 ) mean_effect = false;
      _scheme = mean_effect ? PERM_SIGN_FLIP : PERM_ROW_SHUFFLE;
    }

  if ( opts.method == PERM_CLUSTER )
    {
      std::vector<int> shape = model.feature_shape;
      if ( shape.size() == 0 ) shape.push_back( model.nfeatures() );

      int n = 1;
      for (int d=0; d<shape.size(); d++) n *= shape[d];
      if ( n != model.nfeatures() )
	Helper::halt( "feature shape does not match " + Helper::int2str( model.nfeatures() ) + " features" );

      adj = grid_adjacency( shape , opts.chan_axis , opts.chan_adj.size() ? &opts.chan_adj : NULL );
    }

}


double perm_t::statistic( const glm_fit_t & fit , Eigen::VectorXd * values ) const
{

  Eigen::VectorXd v = opts.metric == PERM_COPES
    ? Eigen::VectorXd( fit.copes.row( gcon ).transpose() )
    : Eigen::VectorXd( fit.tstats.row( gcon ).transpose() );

  if ( values != NULL ) *values = v;

  if ( opts.method == PERM_CLUSTER )
    {
      clusters_t clusters( v , opts.cluster_threshold , adj );
      return clusters.max_mass;
    }

  double mx = 0;
  for (int f=0; f<v.size(); f++)
    if ( fabs( v[f] ) > mx ) mx = fabs( v[f] );
  return mx;
}


bool perm_t::draw( int d , uint64_t seed , double * stat ) const
{

  const design_t & design = model.design;

  const int n = design.nobs();

  Eigen::MatrixXd X = design.X;

  crandom_t rng( seed );

  if ( _scheme == PERM_SIGN_FLIP )
    {
      // balanced signs, shuffled
      std::vector<int> pord( n );
      rng.random_draw( pord );
      for (int i=0; i<n; i++)
	{
	  const double s = pord[i] < n / 2 ? -1 : 1;
	  for (int j=0; j<active.size(); j++)
	    X( i , active[j] ) *= s;
	}
    }
  else
    {
      // permute the rows of the active regressors jointly
      std::vector<int> pord( n );
      rng.random_draw( pord );
      for (int i=0; i<n; i++)
	for (int j=0; j<active.size(); j++)
	  X( i , active[j] ) = design.X( pord[i] , active[j] );
    }

  glm_fit_t fit;

  if ( ! glm_fit( X , design.C , model.data[ flcon ] , &fit ) ) return false;

  *stat = statistic( fit );

  return true;
}


struct perm_record_t {
  perm_record_t( int d , double stat , bool ok ) : d(d) , stat(stat) , ok(ok) { }
  int d;
  double stat;
  bool ok;
};


const null_dist_t & perm_t::run()
{

  if ( _state != PERM_CONFIGURED )
    Helper::halt( "permutations have already been run" );

  _state = PERM_RUNNING;

  const int nperms = opts.nperms;

  logger << "  running " << nperms - 1 << " permutations ("
	 << globals::perm_method( opts.method ) << ", "
	 << globals::perm_scheme( _scheme ) << ", "
	 << opts.nworkers << " thread(s))\n";

  //
  // observed
  //

  glm_fit_t fit;
  if ( ! glm_fit( model.design , model.data[ flcon ] , &fit ) )
    Helper::halt( "observed design is rank deficient" );

  _nulls = null_dist_t();
  _nulls.nulls.push_back( statistic( fit , &_observed ) );

  //
  // one seed per draw, from a single master generator
  //

  crandom_t master( opts.seed );
  std::vector<uint64_t> seeds( nperms , 0 );
  for (int d=1; d<nperms; d++) seeds[d] = master.next_seed();

  std::vector<double> stat( nperms , 0 );
  std::vector<bool> ok( nperms , false );

  if ( opts.nworkers == 1 || nperms < 3 )
    {
      if ( opts.verbose && nperms > 1 ) logger << "  ";

      for (int d=1; d<nperms; d++)
	{
	  double s = 0;
	  ok[d] = draw( d , seeds[d] , &s );
	  stat[d] = s;

	  if ( opts.verbose )
	    {
	      logger << ".";
	      if ( d % 10 == 0 ) logger << " ";
	      if ( d % 50 == 0 ) logger << " " << d << " perms\n" << ( d+1 == nperms ? "" : "  " ) ;
	    }
	}

      if ( opts.verbose && ( nperms - 1 ) % 50 != 0 ) logger << "\n";
    }
  else
    {
      // each worker takes a strided share of the draws; no logging inside workers
      std::vector<std::vector<perm_record_t> > recs( opts.nworkers );

      // an exception in a worker is held and rethrown once all have joined
      std::vector<std::exception_ptr> errs( opts.nworkers );

      std::vector<std::thread> threads;

      for (int w=0; w<opts.nworkers; w++)
	threads.push_back( std::thread( [this,w,nperms,&seeds,&recs,&errs]()
	  {
	    try
	      {
		for (int d=1+w; d<nperms; d+=opts.nworkers)
		  {
		    double s = 0;
		    const bool okay = draw( d , seeds[d] , &s );
		    recs[w].push_back( perm_record_t( d , s , okay ) );
		  }
	      }
	    catch ( ... )
	      {
		errs[w] = std::current_exception();
	      }
	  } ) );

      std::for_each( threads.begin() , threads.end() , []( std::thread & t ) { t.join(); } );

      for (int w=0; w<errs.size(); w++)
	if ( errs[w] ) std::rethrow_exception( errs[w] );

      for (int w=0; w<recs.size(); w++)
	for (int r=0; r<recs[w].size(); r++)
	  {
	    stat[ recs[w][r].d ] = recs[w][r].stat;
	    ok[ recs[w][r].d ] = recs[w][r].ok;
	  }
    }

  //
  // merge in draw order
  //

  for (int d=1; d<nperms; d++)
    {
      if ( ok[d] ) _nulls.nulls.push_back( stat[d] );
      else
	{
	  ++_nulls.nfailed;
	  Helper::warn( "permutation " + Helper::int2str( d ) + " skipped: rank deficient design" );
	}
    }

  _state = PERM_COMPLETE;

  logger << "  observed statistic " << _nulls.nulls[0]
	 << ", " << _nulls.nulls.size() << " values in null distribution";
  if ( _nulls.nfailed ) logger << " (" << _nulls.nfailed << " failed)";
  logger << "\n";

  return _nulls;
}


void perm_t::check_complete() const
{
  if ( _state != PERM_COMPLETE )
    Helper::halt( "permutations have not been run" );
}

const null_dist_t & perm_t::null_dist() const
{
  check_complete();
  return _nulls;
}

double perm_t::get_threshold( double pct ) const
{
  check_complete();
  return _nulls.get_threshold( pct );
}

std::pair<double,double> perm_t::get_thresholds( double pct ) const
{
  check_complete();
  return _nulls.get_thresholds( pct );
}


std::vector<cluster_t> perm_t::get_sig_clusters( double pct ) const
{

  check_complete();

  if ( opts.method != PERM_CLUSTER )
    Helper::halt( "significant clusters require method=cluster" );

  const double thr = _nulls.get_threshold( pct );

  clusters_t clusters( _observed , opts.cluster_threshold , adj );

  const int nn = _nulls.nulls.size();

  std::vector<cluster_t> sig;

  for (int c=0; c<clusters.size(); c++)
    {
      cluster_t cl = clusters.clusters[c];

      // the observed maximum is part of the null, so p >= 1/nn
      int cnt = 0;
      for (int i=0; i<nn; i++)
	if ( _nulls.nulls[i] >= fabs( cl.mass ) ) ++cnt;
      cl.p = cnt / (double)nn;

      if ( fabs( cl.mass ) > thr ) sig.push_back( cl );
    }

  return sig;
}


std::vector<bool> perm_t::get_sig_mask( double pct ) const
{

  check_complete();

  std::vector<bool> mask( _observed.size() , false );

  if ( opts.method == PERM_CLUSTER )
    {
      std::vector<cluster_t> sig = get_sig_clusters( pct );
      for (int c=0; c<sig.size(); c++)
	{
	  std::set<int>::const_iterator mm = sig[c].members.begin();
	  while ( mm != sig[c].members.end() )
	    {
	      mask[ *mm ] = true;
	      ++mm;
	    }
	}
      return mask;
    }

  const double thr = _nulls.get_threshold( pct );

  for (int f=0; f<_observed.size(); f++)
    mask[f] = fabs( _observed[f] ) > thr;

  return mask;
}


null_dist_t run_permutations( const group_glm_t & model , int gcon , int flcon , const perm_opts_t & opts )
{
  perm_t perm( model , gcon , flcon , opts );
  return perm.run();
}
