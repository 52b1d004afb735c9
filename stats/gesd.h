
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

#ifndef __EPHYS_GESD_H__
#define __EPHYS_GESD_H__

#include <vector>

//
// Generalized ESD many-outlier test
//
//   B. Rosner (1983). Percentage Points for a Generalized ESD
//   Many-Outlier Procedure. Technometrics 25(2), pp. 165-172.
//

struct gesd_opts_t
{

  gesd_opts_t()
  {
    alpha = 0.05;
    p_out = 0.1;
    side = 0;
  }

  // significance level (halved for two-sided tests)
  double alpha;

  // max. proportion of outliers tested, i.e. ceil( n * p_out ) rounds
  double p_out;

  // -1 : low outliers only
  //  0 : either tail
  // +1 : high outliers only
  int side;

};


struct gesd_result_t
{

  // one entry per input value; true = outlier
  std::vector<bool> mask;

  // input with outliers removed (missing values kept)
  std::vector<double> cleaned;

  // per-round test statistics and critical values
  std::vector<double> R;
  std::vector<double> lambda;

  // input indices, in order of removal
  std::vector<int> removed;

  int n_outliers() const;

};


gesd_result_t gesd( const std::vector<double> & x , const gesd_opts_t & opts = gesd_opts_t() );

gesd_result_t gesd( const std::vector<double> & x , double alpha , double p_out = 0.1 , int side = 0 );

#endif
