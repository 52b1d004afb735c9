
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

#include "miscmath/crandom.h"

#include <cmath>

const int crandom_t::IA=16807;
const int crandom_t::IM=2147483647;
const int crandom_t::IQ=127773;
const int crandom_t::IR=2836;
const int crandom_t::NTAB=32;
const int crandom_t::NDIV=(1+(IM-1)/NTAB);

const double crandom_t::EPS=3.0e-16;
const double crandom_t::AM=1.0/IM;
const double crandom_t::RNMX=(1.0-EPS);


crandom_t::crandom_t( uint64_t iseed )
{
  srand( iseed );
}


//
// Set seed
//

void crandom_t::srand( uint64_t i )
{

  has_spare = false;
  spare = 0;

  // fold into the valid range 1 .. IM-1
  idum = (int)( i % (uint64_t)( IM - 1 ) ) + 1;

  iv.resize(NTAB);

  // warm-up, then load the shuffle table
  for (int j=NTAB+7;j>=0;j--) {
    int k=idum/IQ;
    idum=IA*(idum-k*IQ)-IR*k;
    if (idum < 0) idum += IM;
    if (j < NTAB) iv[j] = idum;
  }
  iy=iv[0];

}


//
// Return the next random number
//

double crandom_t::rand()
{
  int j,k;
  double temp;

  k=idum/IQ;
  idum=IA*(idum-k*IQ)-IR*k;
  if (idum < 0) idum += IM;
  j=iy/NDIV;
  iy=iv[j];
  iv[j] = idum;
  if ((temp=AM*iy) > RNMX) return RNMX;
  return temp;
}


//
// Return a random integer between 0 and n-1
//

int crandom_t::rand( int n )
{
  int r = int(rand() * n);
  if (r == n) r--;
  return r;
}


double crandom_t::rand_normal()
{
  if ( has_spare )
    {
      has_spare = false;
      return spare;
    }

  double u = rand();
  double v = rand();
  double r = sqrt( -2.0 * log( u ) );
  double theta = 2.0 * M_PI * v;

  spare = r * sin( theta );
  has_spare = true;
  return r * cos( theta );
}


// Fisher-Yates

void crandom_t::random_draw( std::vector<int> & a )
{
  const int n = a.size();
  for (int i=0; i<n; i++) a[i] = i;
  for (int i=n-1; i>0; i--)
    {
      int j = rand( i + 1 );
      int t = a[i];
      a[i] = a[j];
      a[j] = t;
    }
}


uint64_t crandom_t::next_seed()
{
  // two draws -> 62 bits
  uint64_t hi = (uint64_t)( rand() * 2147483648.0 );
  uint64_t lo = (uint64_t)( rand() * 2147483648.0 );
  return ( hi << 31 ) ^ lo;
}
