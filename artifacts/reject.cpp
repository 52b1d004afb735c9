
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

#include "artifacts/reject.h"

#include "artifacts/artifacts.h"
#include "artifacts/maxfilt.h"
#include "dataset/dataset.h"
#include "miscmath/miscmath.h"
#include "stats/gesd.h"
#include "stats/ndarray.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

extern logger_t logger;


void bad_channel_opts_t::set( const param_t & param )
{
  if ( param.has( "picks" ) ) picks = globals::pick( param.value( "picks" ) );
  if ( param.has( "ref-meg" ) ) ref_meg = globals::ref_meg( param.value( "ref-meg" ) );
  alpha = param.get_dbl( "alpha" , alpha );
}

void bad_segment_opts_t::set( const param_t & param )
{
  if ( param.has( "picks" ) ) picks = globals::pick( param.value( "picks" ) );
  if ( param.has( "ref-meg" ) ) ref_meg = globals::ref_meg( param.value( "ref-meg" ) );
  segment_len = param.get_int( "seg" , segment_len );
  alpha = param.get_dbl( "alpha" , alpha );
  if ( param.has( "metric" ) ) metric = globals::metric( param.value( "metric" ) );
  if ( param.has( "mode" ) ) mode = globals::detect_mode( param.value( "mode" ) );
  detect_zeros = param.yesno( "detect-zeros" , detect_zeros , true );
  channel_wise = param.yesno( "channel-wise" , channel_wise , true );
  channel_axis = param.get_int( "ch-axis" , channel_axis );
  if ( param.has( "ch-th" ) )
    {
      channel_any = Helper::iequals( param.value( "ch-th" ) , "any" );
      if ( ! channel_any ) channel_threshold = param.requires_dbl( "ch-th" );
    }
}

void bad_epoch_opts_t::set( const param_t & param )
{
  if ( param.has( "picks" ) ) picks = globals::pick( param.value( "picks" ) );
  if ( param.has( "ref-meg" ) ) ref_meg = globals::ref_meg( param.value( "ref-meg" ) );
  alpha = param.get_dbl( "alpha" , alpha );
  max_percentage = param.get_dbl( "max-pct" , max_percentage );
  outlier_side = param.get_int( "side" , outlier_side );
  if ( param.has( "metric" ) ) metric = globals::metric( param.value( "metric" ) );
  if ( param.has( "mode" ) ) mode = globals::detect_mode( param.value( "mode" ) );
}


std::vector<std::pair<int,int> > flagged_runs( const std::vector<bool> & mask )
{
  std::vector<std::pair<int,int> > r;
  const int n = mask.size();
  int i = 0;
  while ( i < n )
    {
      if ( ! mask[i] ) { ++i; continue; }
      int j = i;
      while ( j + 1 < n && mask[j+1] ) ++j;
      r.push_back( std::make_pair( i , j ) );
      i = j + 1;
    }
  return r;
}


//
// annotate each run of 'mask'; sample[k] is the dataset sample scanned at mask position k
//

static int annotate_runs( dataset_t & dataset ,
			  const std::vector<bool> & mask ,
			  const std::vector<int> & sample ,
			  const std::string & description ,
			  double * duration )
{

  std::vector<std::pair<int,int> > runs = flagged_runs( mask );

  *duration = 0;

  for (int r=0; r<runs.size(); r++)
    {
      // onset at the first, offset at the last flagged sample
      const double onset = dataset.first_time() + dataset.time( sample[ runs[r].first ] );
      const double offset = dataset.first_time() + dataset.time( sample[ runs[r].second ] );
      dataset.annotations.add( onset , offset - onset , description );
      *duration += offset - onset;
    }

  return runs.size();
}


static void report_rejected( const std::string & picks , const std::string & tag ,
			     double duration , double full )
{
  const double pc = full > 0 ? 100.0 * duration / full : 0 ;
  logger << "  Modality " << picks << tag << " - "
	 << Helper::dbl2str( duration , 6 ) << "/" << full
	 << " seconds rejected (" << Helper::dbl2str( pc , 6 ) << "%)\n";
}


bad_channel_result_t bad_channels( dataset_t & dataset , pick_t picks , ref_meg_t ref_meg , double alpha )
{
  bad_channel_opts_t opts;
  opts.picks = picks;
  opts.ref_meg = ref_meg;
  opts.alpha = alpha;
  return bad_channels( dataset , opts );
}


bad_channel_result_t bad_channels( dataset_t & dataset , const bad_channel_opts_t & opts )
{

  bad_channel_result_t res;

  const std::string pstr = globals::pick( opts.picks );

  // channels already marked bad are not re-tested
  const std::vector<int> chans = dataset.picks( opts.picks , opts.ref_meg , true );

  res.n_tested = chans.size();

  if ( chans.size() == 0 )
    {
      logger << "  no good " << pstr << " channels to test\n";
      return res;
    }

  gesd_opts_t gargs;
  gargs.alpha = opts.alpha;

  ndarray_t X( dataset.get_data( chans ) );

  std::vector<bool> bad = find_outliers_in_dims( X , 0 , METRIC_STD , gargs );

  int nbad = 0;
  for (int i=0; i<bad.size(); i++)
    {
      if ( ! bad[i] ) continue;
      ++nbad;
      const std::string & label = dataset.channels[ chans[i] ].label;
      res.flagged.push_back( label );
      if ( dataset.add_bad( label ) ) ++res.n_added;
    }

  logger << "  Modality " << pstr << " - " << nbad << "/" << res.n_tested
	 << " channels rejected (" << Helper::dbl2str( 100.0 * nbad / (double)res.n_tested , 6 ) << "%)\n";

  return res;
}


bad_segment_result_t bad_segments( dataset_t & dataset , const bad_segment_opts_t & opts )
{

  bad_segment_result_t res;

  const std::string pstr = globals::pick( opts.picks );

  if ( opts.segment_len < 1 )
    Helper::halt( "segment length must be a positive integer" );

  const std::vector<int> chans = dataset.picks( opts.picks , opts.ref_meg , true );

  if ( chans.size() == 0 )
    Helper::halt( "no good channels match picks=" + pstr );

  const int ns = dataset.nsamples();

  const double full = ns / dataset.sfreq;

  //
  // GESD over segments (not in maxfilter-only mode)
  //

  if ( opts.mode != DETECT_MAXFILTER )
    {

      // skip samples already annotated as bad
      std::vector<bool> omit = dataset.bad_annotated_samples();
      std::vector<bool> keep( ns );
      std::vector<int> sample;
      for (int s=0; s<ns; s++)
	{
	  keep[s] = ! omit[s];
	  if ( keep[s] ) sample.push_back( s );
	}

      ndarray_t X( dataset.get_data( chans , keep ) );

      if ( opts.mode == DETECT_DIFF && sample.size() > 0 )
	{
	  X = X.diff( 1 );
	  // the first time point has no difference
	  sample.erase( sample.begin() );
	}

      if ( sample.size() == 0 )
	logger << "  no unannotated data left to scan\n";
      else
	{
	  artefact_opts_t sopts;
	  sopts.axis = 1;
	  sopts.mode = SCAN_SEGMENTS;
	  sopts.metric = opts.metric;
	  sopts.segment_len = opts.segment_len;
	  sopts.gesd.alpha = opts.alpha;
	  sopts.channel_wise = opts.channel_wise;
	  sopts.channel_axis = opts.channel_axis;
	  sopts.channel_any = opts.channel_any;
	  sopts.channel_threshold = opts.channel_threshold;

	  std::vector<bool> bad = find_outliers_in_segments( X , sopts );

	  res.n_segments = annotate_runs( dataset , bad , sample , "bad_segment_" + pstr , &res.duration );

	  logger << "  found " << res.n_segments << " bad segments\n";
	  report_rejected( pstr , "" , res.duration , full );
	}
    }

  //
  // zeroed-out blocks from the maxfilter log, on the full sample grid
  //

  if ( opts.mode == DETECT_MAXFILTER || ( opts.mode == DETECT_NONE && opts.detect_zeros ) )
    {

      std::vector<bool> zeroed = detect_maxfilt_zeros( dataset );

      if ( zeroed.size() != 0 )
	{
	  std::vector<int> sample( ns );
	  for (int s=0; s<ns; s++) sample[s] = s;

	  res.n_maxfilter = annotate_runs( dataset , zeroed , sample ,
					   "maxfilter_bad_segment_" + pstr , &res.maxfilter_duration );

	  logger << "  found " << res.n_maxfilter << " bad segments (maxfilter)\n";
	  report_rejected( pstr , " (maxfilter)" , res.maxfilter_duration , full );
	}
    }

  return res;
}


bad_epoch_result_t drop_bad_epochs( dataset_t & dataset , const bad_epoch_opts_t & opts )
{

  bad_epoch_result_t res;

  if ( ! dataset.epochs || dataset.epochs->size() == 0 )
    {
      logger << "  no epoch object found! skipping\n";
      return res;
    }

  if ( opts.mode != DETECT_NONE && opts.mode != DETECT_DIFF )
    Helper::halt( "bad epoch detection mode must be none or diff, not " + globals::detect_mode( opts.mode ) );

  const std::string pstr = globals::pick( opts.picks );

  const std::vector<int> chans = dataset.picks( opts.picks , opts.ref_meg , true );

  if ( chans.size() == 0 )
    Helper::halt( "no good channels match picks=" + pstr );

  epochs_t & epochs = *dataset.epochs;

  const int ne = epochs.size();

  res.n_tested = ne;

  //
  // metric over time, then mean over channels: one value per trial
  //

  std::vector<double> x( ne );

  for (int e=0; e<ne; e++)
    {
      Eigen::MatrixXd T = epochs.trial( e , chans , opts.mode == DETECT_DIFF );

      double s = 0;
      for (int c=0; c<T.rows(); c++)
	{
	  std::vector<double> row( T.cols() );
	  for (int t=0; t<T.cols(); t++) row[t] = T(c,t);
	  s += MiscMath::metric( row , opts.metric );
	}
      x[e] = s / (double)T.rows();
    }

  gesd_opts_t gargs;
  gargs.alpha = opts.alpha;
  gargs.p_out = opts.max_percentage;
  gargs.side = opts.outlier_side;

  std::vector<bool> bad = gesd( x , gargs ).mask;

  if ( epochs.selection.size() != epochs.trials.size() ) epochs.init_log();

  for (int e=0; e<ne; e++)
    if ( bad[e] ) res.dropped.push_back( epochs.selection[e] );

  res.n_dropped = epochs.drop( bad , "gesd_" + globals::metric( opts.metric ) );

  logger << "  Modality " << pstr << " - " << res.n_dropped << "/" << ne << " epochs rejected\n";

  return res;
}
