
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

#include "main.h"

#include "ephys.h"

#include <cstring>
#include <iostream>
#include <fstream>
#include <sstream>
#include <set>
#include <cmath>

#include <boost/version.hpp>

extern logger_t logger;


int main( int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  globals::init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      globals::api();
      std::cerr << ephys_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "Boost v"
		<< BOOST_VERSION / 100000 << "."
		<< BOOST_VERSION / 100 % 1000 << "."
		<< BOOST_VERSION % 100 << "\n";
      return 0;
    }


  //
  // primary usage
  //

  std::string usage_msg = ephys_version() +
    "usage: ephys --gesd file=x.txt [alpha=0.05] [p-out=0.1] [side=0]\n"
    "       ephys --artefacts file=m.txt [axis=-1] [mode=dim|segments] [metric=std] [seg=100]\n"
    "                         [alpha=0.05] [channel-wise] [ch-axis=0] [ch-th=any|0.05]\n"
    "       ephys --glm-perm iv-file=iv.txt dv-file=dv.txt iv=X [covar=Z1,Z2] [nreps=1000]\n"
    "                        [method=max|cluster] [th-cluster=3] [nthreads=1] [seed=1]\n";

  if ( argc < 2 )
    {
      std::cerr << usage_msg ;
      return 1;
    }


  //
  // map of command line options
  //

  std::map<std::string,cmdline_proc_t> clmap;
  clmap[ "--gesd" ]       = PROC_GESD;
  clmap[ "--artefacts" ]  = PROC_ARTEFACTS;
  clmap[ "--artifacts" ]  = PROC_ARTEFACTS;
  clmap[ "--glm-perm" ]   = PROC_GLM_PERM;

  std::string arg1( argv[1] );

  if ( clmap.find( arg1 ) == clmap.end() )
    {
      std::cerr << "error : unrecognized command " << arg1 << "\n" << usage_msg ;
      return 1;
    }

  const cmdline_proc_t cmdline = clmap[ arg1 ];

  logger.banner( globals::version , globals::date );

  try
    {

      param_t param;

      build_param( &param , argc , argv , 2 );

      if ( param.has( "log" ) ) logger.write_log( param.value( "log" ) );

      if      ( cmdline == PROC_GESD )      proc_gesd( param );
      else if ( cmdline == PROC_ARTEFACTS ) proc_artefacts( param );
      else if ( cmdline == PROC_GLM_PERM )  proc_glm_perm( param );

    }
  catch ( const ephys_error & e )
    {
      std::cerr << "error : " << e.what() << "\n";
      return 1;
    }

  return 0;
}


// ------------------------------------------------------------
// ------------------------------------------------------------
//                 Misc helper functions
// ------------------------------------------------------------
// ------------------------------------------------------------


void build_param( param_t * param , int argc , char** argv , int start )
{
  for (int i=start; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;
      param->parse( x );
    }
}


std::string ephys_version()
{
  std::stringstream ss;
  ss << "ephys version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "ephys build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


ndarray_t read_matrix( const std::string & filename )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) ) Helper::halt( "could not open " + f );

  std::ifstream IN1( f.c_str() , std::ios::in );

  std::vector<double> data;
  int nrows = 0 , ncols = -1;

  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      if ( line == "" || line[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::parse( line , " \t," );

      if ( ncols == -1 ) ncols = tok.size();
      else if ( tok.size() != ncols )
	Helper::halt( "bad line in " + f + ": expecting " + Helper::int2str( ncols )
		      + " values, found " + Helper::int2str( (int)tok.size() ) );

      for (int j=0; j<tok.size(); j++)
	{
	  double x;
	  if ( ! Helper::str2dbl_na( tok[j] , &x ) )
	    Helper::halt( "bad numeric value in " + f + ": " + tok[j] );
	  data.push_back( x );
	}
      ++nrows;
    }

  IN1.close();

  if ( nrows == 0 ) Helper::halt( "no data in " + f );

  std::vector<int> shape;
  shape.push_back( nrows );
  if ( ncols > 1 ) shape.push_back( ncols );

  ndarray_t X( shape , 0 );
  X.data = data;
  return X;
}


void read_id_table( const std::string & filename ,
		    std::vector<std::string> * header ,
		    std::map<std::string,std::vector<double> > * rows )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) ) Helper::halt( "could not open " + f );

  std::ifstream IN1( f.c_str() , std::ios::in );

  header->clear();
  rows->clear();

  bool first = true;

  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      if ( line == "" ) continue;

      std::vector<std::string> tok = Helper::parse( line , "\t" );

      if ( first )
	{
	  if ( tok.size() < 2 || ! Helper::iequals( tok[0] , "ID" ) )
	    Helper::halt( "expecting a header row starting ID in " + f );
	  for (int j=1; j<tok.size(); j++) header->push_back( tok[j] );
	  first = false;
	  continue;
	}

      if ( tok.size() != header->size() + 1 )
	Helper::halt( "bad line in " + f + " for " + tok[0] + ": expecting "
		      + Helper::int2str( (int)header->size() + 1 ) + " columns" );

      if ( rows->find( tok[0] ) != rows->end() )
	Helper::halt( "duplicate ID " + tok[0] + " in " + f );

      std::vector<double> & r = (*rows)[ tok[0] ];
      r.resize( header->size() );
      for (int j=1; j<tok.size(); j++)
	if ( ! Helper::str2dbl_na( tok[j] , &r[j-1] ) )
	  Helper::halt( "bad numeric value in " + f + ": " + tok[j] );
    }

  IN1.close();

  logger << "  read " << rows->size() << " rows and " << header->size() << " columns from " << f << "\n";
}


//
// --gesd
//

void proc_gesd( param_t & param )
{

  ndarray_t X = read_matrix( param.requires( "file" ) );

  if ( X.ndim() != 1 ) Helper::halt( "--gesd expects one value per line" );

  gesd_opts_t opts;
  opts.alpha = param.get_dbl( "alpha" , opts.alpha );
  opts.p_out = param.get_dbl( "p-out" , opts.p_out );
  opts.side = param.get_int( "side" , opts.side );

  gesd_result_t res = gesd( X.data , opts );

  logger << "  " << res.n_outliers() << " of " << X.size() << " values flagged as outliers\n";

  std::cout << "IDX\tX\tR\tLAMBDA\n";
  for (int i=0; i<res.removed.size(); i++)
    std::cout << res.removed[i] << "\t"
	      << X.data[ res.removed[i] ] << "\t"
	      << res.R[i] << "\t"
	      << res.lambda[i] << "\n";
}


//
// --artefacts
//

void proc_artefacts( param_t & param )
{

  ndarray_t X = read_matrix( param.requires( "file" ) );

  artefact_opts_t opts;
  opts.set( param );

  artefact_scan_t scan = detect_artefacts( X , opts );

  logger << "  " << scan.n_bad() << " of " << scan.bad.size() << " positions flagged";
  if ( opts.mode == SCAN_SEGMENTS ) logger << " (" << scan.nsegments << " segments)";
  logger << "\n";

  std::vector<std::pair<int,int> > runs = flagged_runs( scan.bad );

  std::cout << "START\tSTOP\n";
  for (int r=0; r<runs.size(); r++)
    std::cout << runs[r].first << "\t" << runs[r].second << "\n";
}


//
// --glm-perm
//

void proc_glm_perm( param_t & param )
{

  const std::string iv = param.requires( "iv" );

  std::vector<std::string> covars;
  if ( param.has( "covar" ) ) covars = param.strvector( "covar" );

  std::vector<std::string> iv_header , dv_header;
  std::map<std::string,std::vector<double> > iv_rows , dv_rows;

  read_id_table( param.requires( "iv-file" ) , &iv_header , &iv_rows );
  read_id_table( param.requires( "dv-file" ) , &dv_header , &dv_rows );

  // columns of the IV file used
  std::vector<std::string> terms;
  terms.push_back( iv );
  for (int c=0; c<covars.size(); c++) terms.push_back( covars[c] );

  std::vector<int> slot;
  for (int t=0; t<terms.size(); t++)
    {
      int k = -1;
      for (int j=0; j<iv_header.size(); j++)
	if ( iv_header[j] == terms[t] ) k = j;
      if ( k == -1 ) Helper::halt( "could not find " + terms[t] + " in iv-file" );
      slot.push_back( k );
    }

  //
  // individuals with complete data in both files
  //

  std::vector<std::string> ids;
  int dropped = 0;

  std::map<std::string,std::vector<double> >::const_iterator ii = dv_rows.begin();
  while ( ii != dv_rows.end() )
    {
      std::map<std::string,std::vector<double> >::const_iterator jj = iv_rows.find( ii->first );
      if ( jj == iv_rows.end() ) { ++ii; continue; }

      bool okay = true;
      for (int t=0; t<slot.size(); t++)
	if ( std::isnan( jj->second[ slot[t] ] ) ) okay = false;
      for (int f=0; f<ii->second.size(); f++)
	if ( std::isnan( ii->second[f] ) ) okay = false;

      if ( okay ) ids.push_back( ii->first );
      else ++dropped;
      ++ii;
    }

  if ( dropped )
    logger << "  dropped " << dropped << " individuals with missing data\n";

  const int n = ids.size();
  const int nf = dv_header.size();

  logger << "  " << n << " individuals, " << nf << " features\n";

  covariates_t covs;
  for (int t=0; t<terms.size(); t++)
    {
      std::vector<double> & x = covs[ terms[t] ];
      x.resize( n );
      for (int i=0; i<n; i++) x[i] = iv_rows[ ids[i] ][ slot[t] ];
    }

  Eigen::MatrixXd Y( n , nf );
  for (int i=0; i<n; i++)
    for (int f=0; f<nf; f++)
      Y(i,f) = dv_rows[ ids[i] ][f];

  //
  // Y ~ intercept + IV + covariates
  //

  design_config_t config;
  config.add_regressor( "Intercept" , REG_CONSTANT );
  for (int t=0; t<terms.size(); t++)
    config.add_regressor( terms[t] , REG_PARAMETRIC , terms[t] );

  std::map<std::string,double> w;
  w[ iv ] = 1;
  config.add_contrast( iv , w );

  design_t design = config.design( covs , n );

  logger << design.summary();

  group_glm_t model( design );
  model.add_data( "dv" , Y );
  model.fit();

  perm_opts_t opts;
  opts.set( param );

  perm_t perm( model , design.contrast( iv ) , 0 , opts );

  perm.run();

  const double pct = 100.0 * ( 1.0 - param.get_dbl( "alpha" , 0.05 ) );

  std::pair<double,double> thr = perm.get_thresholds( pct );

  logger << "  thresholds at " << pct << "th percentile: " << thr.first << " , " << thr.second << "\n";

  std::vector<bool> sig = perm.get_sig_mask( pct );

  const glm_fit_t & fit = model.fits[0];
  const int gcon = design.contrast( iv );

  std::cout << "VAR\tB\tT\tSIG\n";
  for (int f=0; f<nf; f++)
    std::cout << dv_header[f] << "\t"
	      << fit.copes( gcon , f ) << "\t"
	      << fit.tstats( gcon , f ) << "\t"
	      << ( sig[f] ? 1 : 0 ) << "\n";

  if ( opts.method == PERM_CLUSTER )
    {
      std::vector<cluster_t> clusters = perm.get_sig_clusters( pct );
      std::cout << "CLST\tSEED\tMASS\tN\tP\tMEMBERS\n";
      for (int c=0; c<clusters.size(); c++)
	{
	  std::vector<std::string> members;
	  std::set<int>::const_iterator mm = clusters[c].members.begin();
	  while ( mm != clusters[c].members.end() )
	    {
	      members.push_back( dv_header[ *mm ] );
	      ++mm;
	    }
	  std::cout << c+1 << "\t"
		    << dv_header[ clusters[c].seed ] << "\t"
		    << clusters[c].mass << "\t"
		    << clusters[c].members.size() << "\t"
		    << clusters[c].p << "\t"
		    << Helper::stringize( members ) << "\n";
	}
    }
}
