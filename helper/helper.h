
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

#ifndef __EPHYS_HELPER_H__
#define __EPHYS_HELPER_H__

#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace Helper
{

  std::string toupper( const std::string & );

  std::string tolower( const std::string & );

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  bool yesno( const std::string & );

  // case insensitive string comparison
  bool iequals( const std::string& a, const std::string& b );

  // case insensitive: does 'a' start with 'prefix'?
  bool istarts_with( const std::string & a , const std::string & prefix );

  // replace a file extension (e.g. .fif -> .log)
  std::string swap_extension( const std::string & f , const std::string & ext );

  bool fileExists( const std::string & );
  std::string expand( const std::string & f );

  std::istream& safe_getline( std::istream& is, std::string& t );

  void halt( const std::string & msg );
  void warn( const std::string & msg );

  std::string int2str( int n );
  std::string int2str( long n );
  std::string dbl2str( double n );
  std::string dbl2str( double n, int dp );

  bool str2dbl( const std::string & , double * );
  bool str2int( const std::string & , int * );

  // accepts NA / NaN / . as missing
  bool str2dbl_na( const std::string & , double * );

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      return !(iss >> f >> t).fail();
    }

  std::vector<std::string> parse( const std::string & item, const std::string & s = " \t\n" , bool empty = false );

  std::vector<std::string> char_split( const std::string & s , const std::string & delims , bool empty );

  template<typename T>
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;
      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }

}

#endif
