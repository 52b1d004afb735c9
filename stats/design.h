
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

#ifndef __EPHYS_DESIGN_H__
#define __EPHYS_DESIGN_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <map>

#include "defs/defs.h"


// named covariates, one value per observation
typedef std::map<std::string,std::vector<double> > covariates_t;


//
// a built design: regressors (columns of X) and contrasts (rows of C)
//

struct design_t
{

  int nobs() const { return X.rows(); }

  int nregs() const { return X.cols(); }

  int ncons() const { return C.rows(); }

  // -1 if not found
  int regressor( const std::string & name ) const;

  int contrast( const std::string & name ) const;

  // regressors with a non-zero weight in contrast c
  std::vector<int> active( int c ) const;

  int rank() const;

  std::string summary() const;

  Eigen::MatrixXd X;

  Eigen::MatrixXd C;

  std::vector<std::string> regressor_names;

  std::vector<regressor_type_t> regressor_types;

  std::vector<std::string> contrast_names;

};


struct regressor_config_t
{
  std::string name;
  regressor_type_t type;

  // covariate used (not for REG_CONSTANT)
  std::string key;

  // REG_CATEGORICAL: 1 where the covariate equals any code
  std::vector<double> codes;

  // REG_PARAMETRIC: "", "z" or "unitmax"
  std::string preproc;
};


struct contrast_config_t
{
  std::string name;

  // regressor name -> weight
  std::map<std::string,double> values;

  // placeholder expanded to one contrast per regressor
  bool simple;
};


struct design_config_t
{

  void add_regressor( const std::string & name ,
		      regressor_type_t type ,
		      const std::string & key = "" ,
		      const std::vector<double> & codes = std::vector<double>() ,
		      const std::string & preproc = "" );

  void add_contrast( const std::string & name , const std::map<std::string,double> & values );

  // an identity contrast for each regressor
  void add_simple_contrasts();

  // builds X and C for n observations
  design_t design( const covariates_t & covs , int n ) const;

  std::vector<regressor_config_t> regressors;

  std::vector<contrast_config_t> contrasts;

};


// z-score ignoring missing values, which then become 0
std::vector<double> zscore_present( const std::vector<double> & x );

#endif
