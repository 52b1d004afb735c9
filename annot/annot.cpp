
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

#include "annot/annot.h"

#include "helper/helper.h"

bool annotation_t::is_bad() const
{
  return Helper::istarts_with( description , "bad" );
}

void annotation_set_t::add( double onset , double duration , const std::string & description )
{
  if ( duration < 0 )
    Helper::halt( "negative annotation duration for " + description );
  annots.push_back( annotation_t( onset , duration , description ) );
}

std::vector<annotation_t> annotation_set_t::find( const std::string & description ) const
{
  std::vector<annotation_t> r;
  for (int i=0; i<annots.size(); i++)
    if ( annots[i].description == description ) r.push_back( annots[i] );
  return r;
}

double annotation_set_t::total_duration( const std::string & prefix ) const
{
  double d = 0;
  for (int i=0; i<annots.size(); i++)
    if ( Helper::istarts_with( annots[i].description , prefix ) )
      d += annots[i].duration;
  return d;
}
