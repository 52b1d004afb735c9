
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

#include "stats/design.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <set>
#include <sstream>
#include <cmath>
#include <limits>


int design_t::regressor( const std::string & name ) const
{
  for (int i=0; i<regressor_names.size(); i++)
    if ( regressor_names[i] == name ) return i;
  return -1;
}

int design_t::contrast( const std::string & name ) const
{
  for (int i=0; i<contrast_names.size(); i++)
    if ( contrast_names[i] == name ) return i;
  return -1;
}

std::vector<int> design_t::active( int c ) const
{
  if ( c < 0 || c >= C.rows() )
    Helper::halt( "contrast index " + Helper::int2str( c ) + " out of range" );
  std::vector<int> r;
  for (int j=0; j<C.cols(); j++)
    if ( C(c,j) != 0 ) r.push_back( j );
  return r;
}

int design_t::rank() const
{
  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod( X );
  return cod.rank();
}

std::string design_t::summary() const
{
  std::stringstream ss;
  ss << "  design: " << nobs() << " observations, "
     << nregs() << " regressors, " << ncons() << " contrasts\n";
  for (int j=0; j<nregs(); j++)
    ss << "   regressor " << j << " : " << regressor_names[j]
       << " (" << globals::regressor_type( regressor_types[j] ) << ")\n";
  for (int c=0; c<ncons(); c++)
    {
      ss << "   contrast " << c << " : " << contrast_names[c] << " [";
      for (int j=0; j<nregs(); j++) ss << ( j ? " " : "" ) << C(c,j);
      ss << "]\n";
    }
  return ss.str();
}


//
// design_config_t
//

void design_config_t::add_regressor( const std::string & name ,
				     regressor_type_t type ,
				     const std::string & key ,
				     const std::vector<double> & codes ,
				     const std::string & preproc )
{

  if ( name == "" ) Helper::halt( "regressor requires a name" );

  for (int i=0; i<regressors.size(); i++)
    if ( regressors[i].name == name )
      Helper::halt( "regressor name " + name + " used twice" );

  if ( type != REG_CONSTANT && key == "" )
    Helper::halt( "regressor " + name + " requires a covariate key" );

  if ( type == REG_CATEGORICAL && codes.size() == 0 )
    Helper::halt( "categorical regressor " + name + " requires codes" );

  if ( preproc != "" && preproc != "z" && preproc != "unitmax" )
    Helper::halt( "unknown preproc for regressor " + name + ": " + preproc + " (expecting z or unitmax)" );

  regressor_config_t r;
  r.name = name;
  r.type = type;
  r.key = key;
  r.codes = codes;
  r.preproc = preproc;
  regressors.push_back( r );
}

void design_config_t::add_contrast( const std::string & name , const std::map<std::string,double> & values )
{
  if ( name == "" ) Helper::halt( "contrast requires a name" );
  contrast_config_t c;
  c.name = name;
  c.values = values;
  c.simple = false;
  contrasts.push_back( c );
}

void design_config_t::add_simple_contrasts()
{
  contrast_config_t c;
  c.simple = true;
  contrasts.push_back( c );
}


static const std::vector<double> & covariate( const covariates_t & covs ,
					      const std::string & key ,
					      int n )
{
  covariates_t::const_iterator ii = covs.find( key );
  if ( ii == covs.end() )
    Helper::halt( "could not find covariate " + key );
  if ( ii->second.size() != n )
    Helper::halt( "covariate " + key + " has " + Helper::int2str( (int)ii->second.size() )
		  + " values, expecting " + Helper::int2str( n ) );
  for (int i=0; i<n; i++)
    if ( std::isnan( ii->second[i] ) )
      Helper::halt( "missing values in covariate " + key + " (zscore_present() sets these to 0)" );
  return ii->second;
}


design_t design_config_t::design( const covariates_t & covs , int n ) const
{

  if ( n < 1 ) Helper::halt( "design requires at least one observation" );

  if ( regressors.size() == 0 ) Helper::halt( "design has no regressors" );

  std::vector<std::vector<double> > cols;

  design_t d;

  for (int r=0; r<regressors.size(); r++)
    {

      const regressor_config_t & reg = regressors[r];

      if ( reg.type == REG_CONSTANT )
	{
	  cols.push_back( std::vector<double>( n , 1.0 ) );
	  d.regressor_names.push_back( reg.name );
	  d.regressor_types.push_back( reg.type );
	}

      else if ( reg.type == REG_PARAMETRIC )
	{
	  std::vector<double> x = covariate( covs , reg.key , n );

	  if ( reg.preproc == "z" )
	    {
	      const double m = MiscMath::mean( x );
	      const double sd = MiscMath::sdev( x , m );
	      if ( sd == 0 ) Helper::halt( "cannot z-score constant covariate " + reg.key );
	      for (int i=0; i<n; i++) x[i] = ( x[i] - m ) / sd;
	    }
	  else if ( reg.preproc == "unitmax" )
	    {
	      double mn = x[0] , mx = x[0];
	      for (int i=1; i<n; i++)
		{
		  if ( x[i] < mn ) mn = x[i];
		  if ( x[i] > mx ) mx = x[i];
		}
	      if ( mx == mn ) Helper::halt( "cannot unitmax-scale constant covariate " + reg.key );
	      for (int i=0; i<n; i++) x[i] = ( x[i] - mn ) / ( mx - mn );
	    }

	  cols.push_back( x );
	  d.regressor_names.push_back( reg.name );
	  d.regressor_types.push_back( reg.type );
	}

      else if ( reg.type == REG_CATEGORICAL )
	{
	  const std::vector<double> & x = covariate( covs , reg.key , n );
	  std::vector<double> y( n , 0 );
	  for (int i=0; i<n; i++)
	    for (int k=0; k<reg.codes.size(); k++)
	      if ( x[i] == reg.codes[k] ) y[i] = 1;
	  cols.push_back( y );
	  d.regressor_names.push_back( reg.name );
	  d.regressor_types.push_back( reg.type );
	}

      else // REG_MEAN_EFFECTS : one indicator per unique value
	{
	  const std::vector<double> & x = covariate( covs , reg.key , n );
	  std::set<double> levels( x.begin() , x.end() );
	  std::set<double>::const_iterator ll = levels.begin();
	  while ( ll != levels.end() )
	    {
	      std::vector<double> y( n , 0 );
	      for (int i=0; i<n; i++)
		if ( x[i] == *ll ) y[i] = 1;
	      cols.push_back( y );
	      d.regressor_names.push_back( reg.name + "_" + Helper::dbl2str( *ll ) );
	      d.regressor_types.push_back( reg.type );
	      ++ll;
	    }
	}
    }

  // column names must be unique
  std::set<std::string> seen;
  for (int j=0; j<d.regressor_names.size(); j++)
    {
      if ( seen.count( d.regressor_names[j] ) )
	Helper::halt( "duplicate regressor name in design: " + d.regressor_names[j] );
      seen.insert( d.regressor_names[j] );
    }

  const int p = cols.size();

  d.X.resize( n , p );
  for (int j=0; j<p; j++)
    for (int i=0; i<n; i++)
      d.X(i,j) = cols[j][i];

  //
  // contrasts
  //

  std::vector<std::vector<double> > cons;

  for (int c=0; c<contrasts.size(); c++)
    {
      const contrast_config_t & con = contrasts[c];

      if ( con.simple )
	{
	  for (int j=0; j<p; j++)
	    {
	      std::vector<double> w( p , 0 );
	      w[j] = 1;
	      cons.push_back( w );
	      d.contrast_names.push_back( d.regressor_names[j] );
	    }
	  continue;
	}

      std::vector<double> w( p , 0 );
      std::map<std::string,double>::const_iterator vv = con.values.begin();
      while ( vv != con.values.end() )
	{
	  const int j = d.regressor( vv->first );
	  if ( j == -1 )
	    Helper::halt( "contrast " + con.name + " refers to unknown regressor " + vv->first );
	  w[j] = vv->second;
	  ++vv;
	}
      cons.push_back( w );
      d.contrast_names.push_back( con.name );
    }

  d.C = Eigen::MatrixXd::Zero( cons.size() , p );
  for (int c=0; c<cons.size(); c++)
    for (int j=0; j<p; j++)
      d.C(c,j) = cons[c][j];

  return d;
}


std::vector<double> zscore_present( const std::vector<double> & x )
{
  const double m = MiscMath::nanmean( x );
  const double sd = MiscMath::nansdev( x );
  std::vector<double> z( x.size() );
  for (int i=0; i<x.size(); i++)
    {
      if ( std::isnan( x[i] ) ) z[i] = 0;
      else z[i] = ( x[i] - m ) / sd;
    }
  return z;
}
