
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

#ifndef __EPHYS_REJECT_H__
#define __EPHYS_REJECT_H__

#include <string>
#include <vector>

#include "defs/defs.h"

struct dataset_t;
struct param_t;


//
// bad channels: GESD over per-channel standard deviations
//

struct bad_channel_opts_t
{
  bad_channel_opts_t()
  {
    picks = PICK_MEG;
    ref_meg = REF_MEG_AUTO;
    alpha = 0.05;
  }

  void set( const param_t & param );

  pick_t picks;
  ref_meg_t ref_meg;
  double alpha;
};

struct bad_channel_result_t
{
  bad_channel_result_t() { n_tested = n_added = 0; }

  int n_tested;

  // flagged on this call
  std::vector<std::string> flagged;

  // newly added to the registry
  int n_added;
};

bad_channel_result_t bad_channels( dataset_t & dataset , const bad_channel_opts_t & opts );

bad_channel_result_t bad_channels( dataset_t & dataset , pick_t picks ,
				   ref_meg_t ref_meg = REF_MEG_AUTO , double alpha = 0.05 );


//
// bad segments: GESD over per-segment metrics, flagged runs become annotations
//

struct bad_segment_opts_t
{
  bad_segment_opts_t()
  {
    picks = PICK_MEG;
    ref_meg = REF_MEG_AUTO;
    segment_len = 1000;
    alpha = 0.05;
    metric = METRIC_STD;
    mode = DETECT_NONE;
    detect_zeros = true;
    channel_wise = false;
    channel_axis = 0;
    channel_any = false;
    channel_threshold = 0.05;
  }

  void set( const param_t & param );

  pick_t picks;
  ref_meg_t ref_meg;
  int segment_len;
  double alpha;
  metric_t metric;
  detect_mode_t mode;

  // DETECT_NONE only: also annotate maxfilter-zeroed blocks
  bool detect_zeros;

  bool channel_wise;
  int channel_axis;
  bool channel_any;
  double channel_threshold;
};

struct bad_segment_result_t
{
  bad_segment_result_t() { n_segments = n_maxfilter = 0; duration = maxfilter_duration = 0; }

  // annotations added
  int n_segments;
  int n_maxfilter;

  // seconds annotated
  double duration;
  double maxfilter_duration;
};

bad_segment_result_t bad_segments( dataset_t & dataset , const bad_segment_opts_t & opts );


//
// bad epochs: GESD over per-trial metrics (mean over channels)
//

struct bad_epoch_opts_t
{
  bad_epoch_opts_t()
  {
    picks = PICK_MEG;
    ref_meg = REF_MEG_AUTO;
    alpha = 0.05;
    max_percentage = 0.1;
    outlier_side = 0;
    metric = METRIC_STD;
    mode = DETECT_NONE;
  }

  void set( const param_t & param );

  pick_t picks;
  ref_meg_t ref_meg;
  double alpha;
  double max_percentage;
  int outlier_side;
  metric_t metric;

  // DETECT_NONE or DETECT_DIFF
  detect_mode_t mode;
};

struct bad_epoch_result_t
{
  bad_epoch_result_t() { n_tested = n_dropped = 0; }

  int n_tested;
  int n_dropped;

  // original indices of dropped trials
  std::vector<int> dropped;
};

bad_epoch_result_t drop_bad_epochs( dataset_t & dataset , const bad_epoch_opts_t & opts );


// contiguous true runs as (first,last) index pairs, both inclusive
std::vector<std::pair<int,int> > flagged_runs( const std::vector<bool> & mask );

#endif
