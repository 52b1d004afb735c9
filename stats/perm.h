
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

#ifndef __EPHYS_PERM_H__
#define __EPHYS_PERM_H__

#include <Eigen/Dense>

#include <vector>
#include <string>
#include <utility>
#include <cstdint>

#include "defs/defs.h"
#include "stats/glm.h"
#include "stats/cluster.h"

struct param_t;


struct perm_opts_t {

  perm_opts_t()
  {
    nperms = 1000;
    method = PERM_MAXSTAT;
    scheme = PERM_AUTO;
    metric = PERM_TSTATS;
    cluster_threshold = 3;
    chan_axis = -1;
    nworkers = 1;
    seed = 1;
    verbose = false;
  }

  // nreps, method, scheme, metric, th-cluster, nthreads, seed, verbose
  void set( const param_t & param );

  // total draws, including the observed
  int nperms;

  perm_method_t method;

  perm_scheme_t scheme;

  perm_metric_t metric;

  // cluster-forming threshold on |statistic|
  double cluster_threshold;

  // optional channel adjacency along one feature axis
  int chan_axis;
  adjacency_t chan_adj;

  int nworkers;

  uint64_t seed;

  bool verbose;

};


struct null_dist_t {

  null_dist_t() { nfailed = 0; }

  // pct in [0,100], linear interpolation
  double get_threshold( double pct ) const;

  // ( -thr , +thr )
  std::pair<double,double> get_thresholds( double pct ) const;

  // draw order; nulls[0] is the observed statistic
  std::vector<double> nulls;

  // draws skipped (rank deficient permuted design)
  int nfailed;

};


class perm_t {

 public:

  perm_t( const group_glm_t & model , int gcon , int flcon , const perm_opts_t & opts );

  perm_state_t state() const { return _state; }

  const null_dist_t & run();

  const null_dist_t & null_dist() const;

  double get_threshold( double pct ) const;

  std::pair<double,double> get_thresholds( double pct ) const;

  // features significant at pct: max-stat, |observed| above threshold;
  // cluster, member of a significant observed cluster
  std::vector<bool> get_sig_mask( double pct ) const;

  // observed clusters with |mass| above the threshold, with p-values
  std::vector<cluster_t> get_sig_clusters( double pct ) const;

  // observed statistic per feature (t or cope)
  const Eigen::VectorXd & observed() const { return _observed; }

  // scheme actually used (AUTO resolved)
  perm_scheme_t scheme() const { return _scheme; }

 private:

  // statistic for one draw; false if the permuted design is degenerate
  bool draw( int d , uint64_t seed , double * stat ) const;

  double statistic( const glm_fit_t & fit , Eigen::VectorXd * values = NULL ) const;

  void check_complete() const;

  const group_glm_t & model;

  int gcon;

  int flcon;

  perm_opts_t opts;

  perm_scheme_t _scheme;

  perm_state_t _state;

  std::vector<int> active;

  adjacency_t adj;

  Eigen::VectorXd _observed;

  null_dist_t _nulls;

};


// one-shot form
null_dist_t run_permutations( const group_glm_t & model , int gcon , int flcon , const perm_opts_t & opts );

#endif
