
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

#ifndef __EPHYS_ARTIFACTS_H__
#define __EPHYS_ARTIFACTS_H__

#include <vector>
#include <string>

#include "defs/defs.h"
#include "stats/gesd.h"
#include "stats/ndarray.h"

struct param_t;

//
// options for detect_artefacts()
//

struct artefact_opts_t
{

  artefact_opts_t()
  {
    axis = -1;
    mode = SCAN_DIM;
    metric = METRIC_STD;
    segment_len = 100;
    ret = RET_BAD_INDS;
    channel_wise = false;
    channel_axis = 0;
    channel_any = false;
    channel_threshold = 0.05;
  }

  // set from key=value options (axis, mode, metric, seg, alpha, p-out,
  // side, ret, channel-wise, ch-axis, ch-th)
  void set( const param_t & param );

  // axis scanned (units in SCAN_DIM, time in SCAN_SEGMENTS); negative counts from the end
  int axis;

  scan_mode_t mode;

  metric_t metric;

  // samples per segment (last one may be shorter)
  int segment_len;

  gesd_opts_t gesd;

  ret_mode_t ret;

  // SCAN_SEGMENTS only: test each channel separately, then combine
  bool channel_wise;
  int channel_axis;

  // combine as 'any channel', or flag if n_flagged >= threshold * n_channels
  bool channel_any;
  double channel_threshold;

};


struct artefact_scan_t
{

  // one entry per position along the scanned axis; true = bad
  std::vector<bool> bad;

  // RET_BAD_INDS : copy of 'bad' ; RET_GOOD_INDS : its complement
  std::vector<bool> mask;

  // RET_ZERO_BADS / RET_NAN_BADS : input with bad positions replaced
  ndarray_t data;

  // metric per unit (SCAN_DIM) or per segment (SCAN_SEGMENTS, not channel-wise)
  std::vector<double> metric;

  int nsegments;

  int n_bad() const;

};


artefact_scan_t detect_artefacts( const ndarray_t & X , const artefact_opts_t & opts );

// one mask entry per position along axis
std::vector<bool> find_outliers_in_dims( const ndarray_t & X ,
					 int axis ,
					 metric_t metric ,
					 const gesd_opts_t & gesd_args ,
					 std::vector<double> * values = NULL );

// one mask entry per sample along axis
std::vector<bool> find_outliers_in_segments( const ndarray_t & X ,
					     const artefact_opts_t & opts ,
					     std::vector<double> * values = NULL ,
					     int * nsegs = NULL );

#endif
