
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

#include "stats/glm.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


bool glm_fit( const Eigen::MatrixXd & X ,
	      const Eigen::MatrixXd & C ,
	      const Eigen::MatrixXd & Y ,
	      glm_fit_t * fit )
{

  const int n = X.rows();
  const int p = X.cols();
  const int nf = Y.cols();

  if ( Y.rows() != n )
    Helper::halt( "design has " + Helper::int2str( n ) + " rows but data has " + Helper::int2str( (int)Y.rows() ) );

  if ( C.cols() != p )
    Helper::halt( "contrast matrix does not match the number of regressors" );

  //
  // X+ via complete orthogonal decomposition
  //

  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cqr( X );

  fit->rank = cqr.rank();
  fit->dof = n - fit->rank;

  if ( fit->rank < p || fit->dof < 1 ) return false;

  Eigen::MatrixXd Xinv = cqr.pseudoInverse();

  fit->betas = Xinv * Y;

  Eigen::MatrixXd Yres = Y - X * fit->betas;

  fit->resid_var.resize( nf );
  for (int f=0; f<nf; f++)
    fit->resid_var[f] = Yres.col(f).squaredNorm() / (double)fit->dof;

  // (X'X)^-1 = X+ X+'
  Eigen::MatrixXd VX = Xinv * Xinv.transpose();

  fit->copes = C * fit->betas;

  const int nc = C.rows();
  fit->varcopes.resize( nc , nf );
  fit->tstats.resize( nc , nf );

  for (int c=0; c<nc; c++)
    {
      const double vx = C.row(c) * VX * C.row(c).transpose();
      for (int f=0; f<nf; f++)
	{
	  fit->varcopes(c,f) = vx * fit->resid_var[f];
	  fit->tstats(c,f) = fit->copes(c,f) / sqrt( fit->varcopes(c,f) );
	}
    }

  return true;
}


bool glm_fit( const design_t & design , const Eigen::MatrixXd & Y , glm_fit_t * fit )
{
  return glm_fit( design.X , design.C , Y , fit );
}


//
// group_glm_t
//

void group_glm_t::add_data( const std::string & fl_contrast , const Eigen::MatrixXd & Y )
{
  if ( Y.rows() != design.nobs() )
    Helper::halt( "group data for " + fl_contrast + " has " + Helper::int2str( (int)Y.rows() )
		  + " rows, design has " + Helper::int2str( design.nobs() ) );

  if ( data.size() != 0 && Y.cols() != data[0].cols() )
    Helper::halt( "group data for " + fl_contrast + " has a different number of features" );

  for (int i=0; i<fl_contrast_names.size(); i++)
    if ( fl_contrast_names[i] == fl_contrast )
      Helper::halt( "first-level contrast " + fl_contrast + " added twice" );

  fl_contrast_names.push_back( fl_contrast );
  data.push_back( Y );
  fits.clear();
}

void group_glm_t::set_feature_shape( const std::vector<int> & shape )
{
  int n = 1;
  for (int d=0; d<shape.size(); d++) n *= shape[d];
  if ( data.size() != 0 && n != nfeatures() )
    Helper::halt( "feature shape does not match " + Helper::int2str( nfeatures() ) + " features" );
  feature_shape = shape;
}

int group_glm_t::nfeatures() const
{
  return data.size() == 0 ? 0 : data[0].cols();
}

int group_glm_t::fl_contrast( const std::string & name ) const
{
  for (int i=0; i<fl_contrast_names.size(); i++)
    if ( fl_contrast_names[i] == name ) return i;
  return -1;
}

void group_glm_t::fit()
{

  if ( data.size() == 0 ) Helper::halt( "no group data to fit" );

  if ( feature_shape.size() == 0 )
    feature_shape.push_back( nfeatures() );

  fits.resize( data.size() );

  for (int i=0; i<data.size(); i++)
    if ( ! glm_fit( design , data[i] , &fits[i] ) )
      Helper::halt( "could not fit group model for " + fl_contrast_names[i]
		    + ": design rank " + Helper::int2str( fits[i].rank )
		    + " with " + Helper::int2str( design.nregs() ) + " regressors and "
		    + Helper::int2str( design.nobs() ) + " observations" );

  logger << "  fitted group model: " << design.nobs() << " observations, "
	 << design.nregs() << " regressors, " << data.size() << " first-level contrast(s), "
	 << nfeatures() << " features\n";
}
