
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

#ifndef __EPHYS_ANNOT_H__
#define __EPHYS_ANNOT_H__

#include <string>
#include <vector>

//
// time-interval annotation, in seconds relative to the start of acquisition
//

struct annotation_t
{

  annotation_t( double onset , double duration , const std::string & description )
    : onset( onset ) , duration( duration ) , description( description ) { }

  double onset;

  double duration;

  std::string description;

  double offset() const { return onset + duration; }

  // 'bad*' annotations mark data excluded from later scans
  bool is_bad() const;

  bool operator< ( const annotation_t & rhs ) const
  {
    if ( onset < rhs.onset ) return true;
    if ( onset > rhs.onset ) return false;
    if ( duration < rhs.duration ) return true;
    if ( duration > rhs.duration ) return false;
    return description < rhs.description;
  }

};


struct annotation_set_t
{

  void add( double onset , double duration , const std::string & description );

  void add( const annotation_t & a ) { annots.push_back( a ); }

  int size() const { return annots.size(); }

  void clear() { annots.clear(); }

  const annotation_t & operator[]( int i ) const { return annots[i]; }

  // all with this exact description
  std::vector<annotation_t> find( const std::string & description ) const;

  // summed duration of annotations whose description starts with 'prefix'
  double total_duration( const std::string & prefix ) const;

  std::vector<annotation_t> annots;

};

#endif
