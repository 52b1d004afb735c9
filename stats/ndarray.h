
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

#ifndef __EPHYS_NDARRAY_H__
#define __EPHYS_NDARRAY_H__

#include <Eigen/Dense>

#include <vector>
#include <string>

//
// dense n-dimensional array of doubles, row-major (last axis fastest)
//

struct ndarray_t
{

  ndarray_t() { }

  explicit ndarray_t( const std::vector<int> & shape , double value = 0 );

  // 2-D: rows x cols
  explicit ndarray_t( const Eigen::MatrixXd & m );

  int ndim() const { return shape.size(); }

  int size() const { return data.size(); }

  int dim( int axis ) const { return shape[ axis ]; }

  // distance (in elements) between neighbours along each axis
  std::vector<int> strides() const;

  // coordinate of flat element i along 'axis'
  int coord( int i , int axis ) const;

  double & operator[]( int i ) { return data[i]; }
  double operator[]( int i ) const { return data[i]; }

  double & at( int i , int j );
  double at( int i , int j ) const;

  // 2-D only
  Eigen::MatrixXd matrix() const;

  // resolves -1 etc to 0..ndim-1, or halts
  int resolve_axis( int axis , const std::string & label ) const;

  // first-order difference along axis (shape[axis] shrinks by 1)
  ndarray_t diff( int axis ) const;

  std::vector<int> shape;

  std::vector<double> data;

};


#endif
