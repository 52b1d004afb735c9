
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

#ifndef __EPHYS_GLM_H__
#define __EPHYS_GLM_H__

#include <Eigen/Dense>

#include <string>
#include <vector>

#include "stats/design.h"


//
// ordinary least squares: Y ( n x features ) ~ X ( n x p )
//

struct glm_fit_t
{

  glm_fit_t() { dof = rank = 0; }

  // p x features
  Eigen::MatrixXd betas;

  // contrasts x features
  Eigen::MatrixXd copes;
  Eigen::MatrixXd varcopes;
  Eigen::MatrixXd tstats;

  // residual variance per feature
  Eigen::VectorXd resid_var;

  int dof;

  int rank;

};

// false if X is rank deficient or leaves no residual degrees of freedom
bool glm_fit( const Eigen::MatrixXd & X ,
	      const Eigen::MatrixXd & C ,
	      const Eigen::MatrixXd & Y ,
	      glm_fit_t * fit );

bool glm_fit( const design_t & design , const Eigen::MatrixXd & Y , glm_fit_t * fit );


//
// group model: one design, one data matrix per first-level contrast
//

struct group_glm_t
{

  group_glm_t() { }

  group_glm_t( const design_t & d ) : design( d ) { }

  // add the group data for one first-level contrast (observations x features)
  void add_data( const std::string & fl_contrast , const Eigen::MatrixXd & Y );

  // shape of the feature dimensions (e.g. channels x frequencies); defaults to a vector
  void set_feature_shape( const std::vector<int> & shape );

  int nfeatures() const;

  int fl_contrast( const std::string & name ) const;

  // fits every first-level contrast; halts on a degenerate design
  void fit();

  design_t design;

  std::vector<std::string> fl_contrast_names;

  std::vector<Eigen::MatrixXd> data;

  std::vector<int> feature_shape;

  std::vector<glm_fit_t> fits;

};

#endif
