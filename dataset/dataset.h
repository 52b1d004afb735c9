
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

#ifndef __EPHYS_DATASET_H__
#define __EPHYS_DATASET_H__

#include <Eigen/Dense>

#include <string>
#include <vector>
#include <set>
#include <memory>

#include "defs/defs.h"
#include "annot/annot.h"


struct channel_t
{
  channel_t( const std::string & label , channel_type_t type )
    : label( label ) , type( type ) { }

  std::string label;

  channel_type_t type;
};


//
// trials (channels x samples each), with a drop log
//

struct epochs_t
{

  int size() const { return trials.size(); }

  // remove trials flagged in 'mask' (one entry per current trial)
  int drop( const std::vector<bool> & mask , const std::string & reason );

  // picked channels, diff'ed along time if requested
  Eigen::MatrixXd trial( int e , const std::vector<int> & picks , bool diff ) const;

  std::vector<Eigen::MatrixXd> trials;

  // event code per trial
  std::vector<int> events;

  // original index of each current trial
  std::vector<int> selection;

  // one entry per original trial: empty if kept, else the reason
  std::vector<std::string> drop_log;

  // call once trials are filled
  void init_log();

};


//
// continuous recording plus the metadata the rejection policies update
//

struct dataset_t
{

  dataset_t()
  {
    sfreq = 1;
    first_samp = 0;
    compensated = false;
  }

  // recording file; the maxfilter log sits beside it
  std::string filename;

  double sfreq;

  // samples between start of acquisition and the first stored sample
  int first_samp;

  // software gradient compensation applied (CTF); controls ref_meg=auto
  bool compensated;

  std::vector<channel_t> channels;

  // channels x samples
  Eigen::MatrixXd data;

  // bad channel registry, in order of addition
  std::vector<std::string> bads;

  annotation_set_t annotations;

  std::unique_ptr<epochs_t> epochs;

  int nchans() const { return channels.size(); }

  int nsamples() const { return data.cols(); }

  double first_time() const { return first_samp / sfreq; }

  // seconds from first stored sample
  double time( int s ) const { return s / sfreq; }

  int channel( const std::string & label ) const;

  bool is_bad( const std::string & label ) const;

  // false if already registered
  bool add_bad( const std::string & label );

  // indices of channels matching a selection
  std::vector<int> picks( pick_t p , ref_meg_t ref , bool exclude_bads = true ) const;

  // samples covered by an annotation starting 'bad'
  std::vector<bool> bad_annotated_samples() const;

  // picked rows, sample columns where keep[s] (all if keep is empty)
  Eigen::MatrixXd get_data( const std::vector<int> & rows , const std::vector<bool> & keep = std::vector<bool>() ) const;

};


#endif
