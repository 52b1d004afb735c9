
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

#ifndef __EPHYS_CRANDOM_H__
#define __EPHYS_CRANDOM_H__

#include <vector>
#include <cstdint>

//
// Park & Miller minimal standard generator with Bays-Durham shuffle;
// one instance per stream (e.g. per permutation draw), no shared state
//

class crandom_t
{
 public:

  static const int IA;
  static const int IM;
  static const int IQ;
  static const int IR;
  static const int NTAB;
  static const int NDIV;

  static const double EPS;
  static const double AM;
  static const double RNMX;

  explicit crandom_t( uint64_t iseed = 1 );

  void srand( uint64_t iseed );

  // uniform on (0,1)
  double rand();

  // integer in [0,n)
  int rand( int n );

  // standard normal (Box-Muller)
  double rand_normal();

  // fill with a random permutation of 0..n-1
  void random_draw( std::vector<int> & a );

  // seed for an independent sub-stream
  uint64_t next_seed();

 private:

  int idum;
  int iy;
  std::vector<int> iv;

  bool has_spare;
  double spare;

};

#endif
