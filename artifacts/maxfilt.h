
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

#ifndef __EPHYS_MAXFILT_H__
#define __EPHYS_MAXFILT_H__

#include <string>
#include <vector>
#include <iostream>

struct dataset_t;

//
// MaxFilter log: data blocks skipped (zeroed) while continuous HPI was off
//

struct maxfilt_log_t
{

  maxfilt_log_t()
  {
    n_dataseg = 0;
  }

  // false if the log could not be parsed
  bool parse( std::istream & in );

  // samples zeroed, over a recording of n_times samples
  std::vector<bool> bad_samples( int n_times , double first_time , double sfreq ) const;

  // number of data buffers the recording was processed in
  int n_dataseg;

  // start times (s) of skipped blocks
  std::vector<double> zeroed;

};

// log file expected beside a recording
std::string maxfilt_log_name( const std::string & recording );

// zeroed samples of the dataset; empty if no log exists or it cannot be parsed
std::vector<bool> detect_maxfilt_zeros( const dataset_t & dataset );

#endif
