
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

#include "stats/ndarray.h"

#include "helper/helper.h"

ndarray_t::ndarray_t( const std::vector<int> & shape_ , double value )
  : shape( shape_ )
{
  int n = 1;
  for (int d=0; d<shape.size(); d++)
    {
      if ( shape[d] < 0 ) Helper::halt( "negative array dimension" );
      n *= shape[d];
    }
  data.resize( n , value );
}

ndarray_t::ndarray_t( const Eigen::MatrixXd & m )
{
  shape.resize( 2 );
  shape[0] = m.rows();
  shape[1] = m.cols();
  data.resize( m.rows() * m.cols() );
  int k = 0;
  for (int r=0; r<m.rows(); r++)
    for (int c=0; c<m.cols(); c++)
      data[k++] = m(r,c);
}

std::vector<int> ndarray_t::strides() const
{
  std::vector<int> s( shape.size() , 1 );
  for (int d=(int)shape.size()-2; d>=0; d--)
    s[d] = s[d+1] * shape[d+1];
  return s;
}

int ndarray_t::coord( int i , int axis ) const
{
  int stride = 1;
  for (int d=(int)shape.size()-1; d>axis; d--) stride *= shape[d];
  return ( i / stride ) % shape[ axis ];
}

double & ndarray_t::at( int i , int j )
{
  return data[ i * shape[1] + j ];
}

double ndarray_t::at( int i , int j ) const
{
  return data[ i * shape[1] + j ];
}

Eigen::MatrixXd ndarray_t::matrix() const
{
  if ( shape.size() != 2 ) Helper::halt( "expecting a 2-D array" );
  Eigen::MatrixXd m( shape[0] , shape[1] );
  int k = 0;
  for (int r=0; r<shape[0]; r++)
    for (int c=0; c<shape[1]; c++)
      m(r,c) = data[k++];
  return m;
}

int ndarray_t::resolve_axis( int axis , const std::string & label ) const
{
  const int nd = shape.size();
  const int a = axis < 0 ? nd + axis : axis ;
  if ( a < 0 || a >= nd )
    Helper::halt( "bad " + label + " " + Helper::int2str( axis )
		  + " for a " + Helper::int2str( nd ) + "-D array" );
  return a;
}

ndarray_t ndarray_t::diff( int axis ) const
{
  const int a = resolve_axis( axis , "axis" );

  std::vector<int> s2 = shape;
  s2[a] = shape[a] > 0 ? shape[a] - 1 : 0 ;
  ndarray_t d( s2 );
  if ( d.size() == 0 ) return d;

  const std::vector<int> st = strides();
  const std::vector<int> st2 = d.strides();

  // walk the output; its element k maps back to input coordinates
  for (int k=0; k<d.size(); k++)
    {
      int rem = k , src = 0;
      for (int j=0; j<s2.size(); j++)
	{
	  const int c = rem / st2[j];
	  rem %= st2[j];
	  src += c * st[j];
	}
      d.data[k] = data[ src + st[a] ] - data[ src ];
    }
  return d;
}
