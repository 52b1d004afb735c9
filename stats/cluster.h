
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

#ifndef __EPHYS_CLUSTER_H__
#define __EPHYS_CLUSTER_H__

#include <Eigen/Dense>

#include <vector>
#include <map>
#include <set>
#include <cmath>

// feature index -> neighbouring feature indices
typedef std::map<int,std::set<int> > adjacency_t;

// neighbours at +/-1 along each axis of a row-major feature grid; if
// chan_adj is given, it replaces index contiguity along chan_axis
adjacency_t grid_adjacency( const std::vector<int> & shape ,
			    int chan_axis = -1 ,
			    const adjacency_t * chan_adj = NULL );


struct cluster_t {

  // signed sum of the statistic over members
  double mass;

  // feature with the largest |statistic|
  int seed;

  std::set<int> members;

  // permutation p-value (set by perm_t)
  double p;

  bool operator< ( const cluster_t & rhs ) const
  {
    if ( fabs( mass ) > fabs( rhs.mass ) ) return true;
    if ( fabs( mass ) < fabs( rhs.mass ) ) return false;
    return seed < rhs.seed;
  }

};


//
// connected, same-signed sets of features with |T| above threshold
//

struct clusters_t {

  clusters_t( const Eigen::VectorXd & T ,
	      double threshold ,
	      const adjacency_t & adj );

  int size() const { return clusters.size(); }

  // largest |mass|, 0 if no clusters
  double max_mass;

  // by decreasing |mass|
  std::vector<cluster_t> clusters;

  // cluster per feature, or -1
  std::vector<int> label;

};

#endif
