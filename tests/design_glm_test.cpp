
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

#include "stats/design.h"
#include "stats/glm.h"
#include "defs/defs.h"

#include <cmath>
#include <limits>

namespace {

covariates_t covariates()
{
  covariates_t covs;
  const double age[] = { 20 , 30 , 40 , 50 , 60 , 70 };
  const double group[] = { 1 , 1 , 2 , 2 , 3 , 3 };
  covs[ "age" ] = std::vector<double>( age , age + 6 );
  covs[ "group" ] = std::vector<double>( group , group + 6 );
  return covs;
}

}

TEST( DesignTest , BuildsRegressors )
{
  design_config_t config;
  config.add_regressor( "Intercept" , REG_CONSTANT );
  config.add_regressor( "Age" , REG_PARAMETRIC , "age" , std::vector<double>() , "unitmax" );
  config.add_regressor( "GroupA" , REG_CATEGORICAL , "group" , std::vector<double>( 1 , 1 ) );

  design_t d = config.design( covariates() , 6 );

  ASSERT_EQ( d.nobs() , 6 );
  ASSERT_EQ( d.nregs() , 3 );
  EXPECT_EQ( d.X(4,0) , 1 );
  EXPECT_DOUBLE_EQ( d.X(0,1) , 0 );
  EXPECT_DOUBLE_EQ( d.X(5,1) , 1 );
  EXPECT_DOUBLE_EQ( d.X(2,1) , 0.4 );
  EXPECT_EQ( d.X(1,2) , 1 );
  EXPECT_EQ( d.X(2,2) , 0 );
  EXPECT_EQ( d.ncons() , 0 );
}

TEST( DesignTest , ZScoredRegressor )
{
  design_config_t config;
  config.add_regressor( "Age" , REG_PARAMETRIC , "age" , std::vector<double>() , "z" );
  design_t d = config.design( covariates() , 6 );

  double m = 0 , ss = 0;
  for (int i=0; i<6; i++) m += d.X(i,0);
  m /= 6.0;
  for (int i=0; i<6; i++) ss += ( d.X(i,0) - m ) * ( d.X(i,0) - m );
  EXPECT_NEAR( m , 0 , 1e-12 );
  EXPECT_NEAR( ss / 6.0 , 1 , 1e-12 );
}

TEST( DesignTest , MeanEffectsAndSimpleContrasts )
{
  design_config_t config;
  config.add_regressor( "grp" , REG_MEAN_EFFECTS , "group" );
  config.add_simple_contrasts();

  std::map<std::string,double> w;
  w[ "grp_1" ] = 1;
  w[ "grp_3" ] = -1;
  config.add_contrast( "1v3" , w );

  design_t d = config.design( covariates() , 6 );

  ASSERT_EQ( d.nregs() , 3 );
  EXPECT_EQ( d.regressor_names[0] , "grp_1" );
  EXPECT_EQ( d.regressor_names[2] , "grp_3" );
  EXPECT_EQ( d.X(2,1) , 1 );
  EXPECT_EQ( d.X(2,0) , 0 );

  ASSERT_EQ( d.ncons() , 4 );
  EXPECT_EQ( d.contrast_names[1] , "grp_2" );
  EXPECT_EQ( d.C(1,1) , 1 );
  EXPECT_EQ( d.contrast( "1v3" ) , 3 );
  EXPECT_EQ( d.C(3,0) , 1 );
  EXPECT_EQ( d.C(3,2) , -1 );

  std::vector<int> act = d.active( 3 );
  ASSERT_EQ( act.size() , 2u );
  EXPECT_EQ( act[0] , 0 );
  EXPECT_EQ( act[1] , 2 );
}

TEST( DesignTest , RejectsBadConfigurations )
{
  design_config_t config;
  config.add_regressor( "Intercept" , REG_CONSTANT );
  EXPECT_THROW( config.add_regressor( "Intercept" , REG_CONSTANT ) , ephys_error );
  EXPECT_THROW( config.add_regressor( "X" , REG_PARAMETRIC ) , ephys_error );
  EXPECT_THROW( config.add_regressor( "X" , REG_CATEGORICAL , "group" ) , ephys_error );
  EXPECT_THROW( config.add_regressor( "X" , REG_PARAMETRIC , "age" , std::vector<double>() , "log" ) , ephys_error );

  design_config_t missing;
  missing.add_regressor( "Height" , REG_PARAMETRIC , "height" );
  EXPECT_THROW( missing.design( covariates() , 6 ) , ephys_error );

  design_config_t length;
  length.add_regressor( "Age" , REG_PARAMETRIC , "age" );
  EXPECT_THROW( length.design( covariates() , 5 ) , ephys_error );

  design_config_t contrast;
  contrast.add_regressor( "Age" , REG_PARAMETRIC , "age" );
  std::map<std::string,double> w;
  w[ "Sex" ] = 1;
  contrast.add_contrast( "Sex" , w );
  EXPECT_THROW( contrast.design( covariates() , 6 ) , ephys_error );
}

TEST( DesignTest , ZScorePresentFillsMissing )
{
  std::vector<double> x;
  x.push_back( 1 );
  x.push_back( std::numeric_limits<double>::quiet_NaN() );
  x.push_back( 3 );

  std::vector<double> z = zscore_present( x );
  EXPECT_DOUBLE_EQ( z[0] , -1 );
  EXPECT_DOUBLE_EQ( z[1] , 0 );
  EXPECT_DOUBLE_EQ( z[2] , 1 );
}

TEST( GlmTest , OrdinaryLeastSquares )
{
  // y = 2 + 3x + e, with e orthogonal to the design
  Eigen::MatrixXd X( 6 , 2 );
  Eigen::MatrixXd Y( 6 , 1 );
  const double e[] = { 1 , -1 , -1 , 1 , 0 , 0 };
  for (int i=0; i<6; i++)
    {
      X(i,0) = 1;
      X(i,1) = i;
      Y(i,0) = 2 + 3 * i + e[i];
    }

  Eigen::MatrixXd C = Eigen::MatrixXd::Identity( 2 , 2 );

  glm_fit_t fit;
  ASSERT_TRUE( glm_fit( X , C , Y , &fit ) );

  EXPECT_EQ( fit.rank , 2 );
  EXPECT_EQ( fit.dof , 4 );
  EXPECT_NEAR( fit.betas(0,0) , 2 , 1e-10 );
  EXPECT_NEAR( fit.betas(1,0) , 3 , 1e-10 );
  EXPECT_NEAR( fit.resid_var[0] , 1 , 1e-10 );

  // var(slope) = s2 / Sxx , Sxx = 17.5
  EXPECT_NEAR( fit.varcopes(1,0) , 1 / 17.5 , 1e-10 );
  EXPECT_NEAR( fit.varcopes(0,0) , 1 / 6.0 + 6.25 / 17.5 , 1e-10 );
  EXPECT_NEAR( fit.tstats(1,0) , 3 * sqrt( 17.5 ) , 1e-8 );
}

TEST( GlmTest , DegenerateDesignsFail )
{
  Eigen::MatrixXd X( 4 , 2 );
  X << 1 , 1 ,
       1 , 1 ,
       1 , 1 ,
       1 , 1 ;
  Eigen::MatrixXd Y = Eigen::MatrixXd::Ones( 4 , 3 );
  Eigen::MatrixXd C = Eigen::MatrixXd::Identity( 2 , 2 );

  glm_fit_t fit;
  EXPECT_FALSE( glm_fit( X , C , Y , &fit ) );
  EXPECT_EQ( fit.rank , 1 );

  // no residual degrees of freedom
  Eigen::MatrixXd X2( 2 , 2 );
  X2 << 1 , 0 ,
        1 , 1 ;
  EXPECT_FALSE( glm_fit( X2 , C , Eigen::MatrixXd::Ones( 2 , 1 ) , &fit ) );
}

TEST( GlmTest , GroupModelFitsEachFirstLevelContrast )
{
  design_config_t config;
  config.add_regressor( "Intercept" , REG_CONSTANT );
  config.add_regressor( "Age" , REG_PARAMETRIC , "age" , std::vector<double>() , "z" );
  config.add_simple_contrasts();

  group_glm_t model( config.design( covariates() , 6 ) );

  Eigen::MatrixXd Y1( 6 , 4 ) , Y2( 6 , 4 );
  for (int i=0; i<6; i++)
    for (int f=0; f<4; f++)
      {
	Y1(i,f) = i * ( f + 1 ) + ( i % 2 );
	Y2(i,f) = f - i + ( i % 3 );
      }

  model.add_data( "alpha" , Y1 );
  model.add_data( "beta" , Y2 );
  model.set_feature_shape( std::vector<int>( 1 , 4 ) );

  EXPECT_THROW( model.add_data( "alpha" , Y1 ) , ephys_error );
  EXPECT_THROW( model.add_data( "gamma" , Eigen::MatrixXd::Ones( 5 , 4 ) ) , ephys_error );
  EXPECT_THROW( model.set_feature_shape( std::vector<int>( 1 , 5 ) ) , ephys_error );

  model.fit();

  ASSERT_EQ( model.fits.size() , 2u );
  EXPECT_EQ( model.fl_contrast( "beta" ) , 1 );
  EXPECT_EQ( model.fits[0].tstats.rows() , 2 );
  EXPECT_EQ( model.fits[0].tstats.cols() , 4 );
  EXPECT_GT( model.fits[0].tstats(1,0) , 0 );
  EXPECT_LT( model.fits[1].tstats(1,0) , 0 );
}
