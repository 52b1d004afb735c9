
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

#include "artifacts/artifacts.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"
#include "param.h"

#include <cmath>
#include <limits>

extern logger_t logger;


void artefact_opts_t::set( const param_t & param )
{

  if ( param.has( "axis" ) ) axis = param.requires_int( "axis" );

  if ( param.has( "mode" ) ) mode = globals::scan_mode( param.value( "mode" ) );

  if ( param.has( "metric" ) ) metric = globals::metric( param.value( "metric" ) );

  segment_len = param.get_int( "seg" , segment_len );

  gesd.alpha = param.get_dbl( "alpha" , gesd.alpha );
  gesd.p_out = param.get_dbl( "p-out" , gesd.p_out );
  gesd.side = param.get_int( "side" , gesd.side );

  if ( param.has( "ret" ) ) ret = globals::ret_mode( param.value( "ret" ) );

  channel_wise = param.yesno( "channel-wise" , channel_wise , true );

  channel_axis = param.get_int( "ch-axis" , channel_axis );

  if ( param.has( "ch-th" ) )
    {
      if ( Helper::iequals( param.value( "ch-th" ) , "any" ) )
	channel_any = true;
      else
	{
	  channel_any = false;
	  channel_threshold = param.requires_dbl( "ch-th" );
	}
    }
}


int artefact_scan_t::n_bad() const
{
  int n = 0;
  for (int i=0; i<bad.size(); i++)
    if ( bad[i] ) ++n;
  return n;
}


//
// values of X grouped by ( segment along 'axis' , position along 'ch_axis' ),
// i.e. group g = seg * nch + ch ;  ch_axis == -1 means a single group per segment
//

static std::vector<std::vector<double> > gather( const ndarray_t & X ,
						 int axis ,
						 int seglen ,
						 int ch_axis )
{
  const int nt = X.dim( axis );
  const int nseg = ( nt + seglen - 1 ) / seglen;
  const int nch = ch_axis == -1 ? 1 : X.dim( ch_axis );

  std::vector<std::vector<double> > g( nseg * nch );

  const std::vector<int> st = X.strides();

  for (int i=0; i<X.size(); i++)
    {
      const int t = ( i / st[axis] ) % nt;
      const int c = ch_axis == -1 ? 0 : ( i / st[ch_axis] ) % nch;
      g[ ( t / seglen ) * nch + c ].push_back( X.data[i] );
    }

  return g;
}


std::vector<bool> find_outliers_in_dims( const ndarray_t & X ,
					 int axis ,
					 metric_t metric ,
					 const gesd_opts_t & gesd_args ,
					 std::vector<double> * values )
{

  const int a = X.resolve_axis( axis , "axis" );

  // one group per unit along 'a', spanning all other axes
  std::vector<std::vector<double> > g = gather( X , a , 1 , -1 );

  std::vector<double> m( g.size() );
  for (int u=0; u<g.size(); u++)
    m[u] = MiscMath::metric( g[u] , metric );

  if ( values != NULL ) *values = m;

  return gesd( m , gesd_args ).mask;
}


std::vector<bool> find_outliers_in_segments( const ndarray_t & X ,
					     const artefact_opts_t & opts ,
					     std::vector<double> * values ,
					     int * nsegs )
{

  const int axis = X.resolve_axis( opts.axis , "axis" );

  if ( opts.segment_len < 1 )
    Helper::halt( "segment length must be a positive integer, not " + Helper::int2str( opts.segment_len ) );

  const int nt = X.dim( axis );
  const int seglen = opts.segment_len;
  const int nseg = ( nt + seglen - 1 ) / seglen;

  if ( nsegs != NULL ) *nsegs = nseg;

  // segment-level flags
  std::vector<bool> seg_bad( nseg , false );

  if ( opts.channel_wise )
    {

      const int ch_axis = X.resolve_axis( opts.channel_axis , "channel axis" );

      if ( ch_axis == axis )
	Helper::halt( "the time axis and channel axis cannot be the same" );

      const int nch = X.dim( ch_axis );

      if ( ! opts.channel_any )
	{
	  if ( ! ( opts.channel_threshold > 0 && opts.channel_threshold <= 1 ) )
	    Helper::halt( "channel threshold must be between 0 and 1, or 'any', not "
			  + Helper::dbl2str( opts.channel_threshold ) );

	  if ( nch * opts.channel_threshold < 1 )
	    Helper::halt( "channel threshold x number of channels must be at least 1 channel" );
	}

      std::vector<std::vector<double> > g = gather( X , axis , seglen , ch_axis );

      // number of channels flagging each segment
      std::vector<int> cnt( nseg , 0 );

      for (int c=0; c<nch; c++)
	{
	  std::vector<double> m( nseg );
	  for (int s=0; s<nseg; s++)
	    {
	      m[s] = MiscMath::metric( g[ s * nch + c ] , opts.metric );
	      if ( std::isnan( m[s] ) ) m[s] = 0;
	    }

	  std::vector<bool> flagged = gesd( m , opts.gesd ).mask;
	  for (int s=0; s<nseg; s++)
	    if ( flagged[s] ) ++cnt[s];
	}

      for (int s=0; s<nseg; s++)
	seg_bad[s] = opts.channel_any ?
	  cnt[s] > 0 :
	  cnt[s] >= opts.channel_threshold * nch ;

    }
  else
    {

      std::vector<std::vector<double> > g = gather( X , axis , seglen , -1 );

      std::vector<double> m( nseg );
      for (int s=0; s<nseg; s++)
	{
	  m[s] = MiscMath::metric( g[s] , opts.metric );
	  if ( std::isnan( m[s] ) ) m[s] = 0;
	}

      if ( values != NULL ) *values = m;

      seg_bad = gesd( m , opts.gesd ).mask;
    }

  // broadcast to samples
  std::vector<bool> bad( nt , false );
  for (int t=0; t<nt; t++)
    bad[t] = seg_bad[ t / seglen ];

  return bad;
}


artefact_scan_t detect_artefacts( const ndarray_t & X , const artefact_opts_t & opts )
{

  artefact_scan_t res;

  const int axis = X.resolve_axis( opts.axis , "axis" );

  res.nsegments = 0;

  if ( opts.mode == SCAN_DIM )
    res.bad = find_outliers_in_dims( X , axis , opts.metric , opts.gesd , &res.metric );
  else
    res.bad = find_outliers_in_segments( X , opts , &res.metric , &res.nsegments );

  if ( opts.ret == RET_BAD_INDS )
    res.mask = res.bad;
  else if ( opts.ret == RET_GOOD_INDS )
    {
      res.mask.resize( res.bad.size() );
      for (int i=0; i<res.bad.size(); i++) res.mask[i] = ! res.bad[i];
    }
  else
    {
      const double fill = opts.ret == RET_ZERO_BADS ? 0 : std::numeric_limits<double>::quiet_NaN();
      res.data = X;
      for (int i=0; i<X.size(); i++)
	if ( res.bad[ X.coord( i , axis ) ] )
	  res.data.data[i] = fill;
    }

  return res;
}
